/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_maths_ImportExport_h
#define INCLUDED_cval_maths_ImportExport_h

// Symbols only need explicit export/import decoration for Windows DLLs.
#ifdef Windows
#ifdef BUILDING_libmaths
#define MATHS_EXPORT __declspec(dllexport)
#else
#define MATHS_EXPORT __declspec(dllimport)
#endif
#else
#define MATHS_EXPORT
#endif

#endif // INCLUDED_cval_maths_ImportExport_h
