//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/ite/version.hpp
// Purpose: Version constants reported by the ite front end.
// Key invariants: ITE_VERSION_STR is a string literal.
// Ownership/Lifetime: Header-only constants.
//
//===----------------------------------------------------------------------===//

#pragma once

#define ITE_VERSION_MAJOR 0
#define ITE_VERSION_MINOR 3
#define ITE_VERSION_PATCH 0
#define ITE_VERSION_STR "0.3.0"
