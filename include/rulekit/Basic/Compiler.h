//===- Compiler.h -----------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//
//
// Compiler support macros shared by the rulekit libraries.
//
//===----------------------------------------------------------------------===//

#ifndef RULEKIT_BASIC_COMPILER_H
#define RULEKIT_BASIC_COMPILER_H

/// RULEKIT_DELETED_FUNCTION - Marks a member as uncallable.
///
/// Copy constructors and assignment operators of the engine objects that own
/// external resources (hashers, holders, contexts) are declared private with
/// this marker:
///
/// class DontCopy {
/// private:
///   DontCopy(const DontCopy&) RULEKIT_DELETED_FUNCTION;
///   DontCopy &operator =(const DontCopy&) RULEKIT_DELETED_FUNCTION;
/// public:
///   ...
/// };
#define RULEKIT_DELETED_FUNCTION = delete

/// RULEKIT_LIKELY / RULEKIT_UNLIKELY - Branch hints for the hashing hot path.
#if defined(__GNUC__) || defined(__clang__)
#define RULEKIT_LIKELY(x) __builtin_expect(!!(x), 1)
#define RULEKIT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define RULEKIT_LIKELY(x) (x)
#define RULEKIT_UNLIKELY(x) (x)
#endif

#endif
