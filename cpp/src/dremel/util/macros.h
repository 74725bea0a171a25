// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#define DREMEL_EXPAND(x) x
#define DREMEL_STRINGIFY(x) #x
#define DREMEL_CONCAT(x, y) x##y

// From Google gutil
#ifndef DREMEL_DISALLOW_COPY_AND_ASSIGN
#define DREMEL_DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&) = delete;             \
  void operator=(const TypeName&) = delete
#endif

#define DREMEL_UNUSED(x) (void)(x)

#ifndef NULLPTR
#define NULLPTR nullptr
#endif

//
// GCC can be told that a certain branch is not likely to be taken (for
// instance, a CHECK failure), and use that information in static analysis.
// Giving it this information can help it optimize for the common case in
// the absence of better information (ie. -fprofile-arcs).
//
#if defined(__GNUC__)
#define DREMEL_PREDICT_FALSE(x) (__builtin_expect(!!(x), 0))
#define DREMEL_PREDICT_TRUE(x) (__builtin_expect(!!(x), 1))
#define DREMEL_NORETURN __attribute__((noreturn))
#define DREMEL_NOINLINE __attribute__((noinline))
#define DREMEL_FORCE_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER)
#define DREMEL_NORETURN __declspec(noreturn)
#define DREMEL_NOINLINE __declspec(noinline)
#define DREMEL_FORCE_INLINE __forceinline
#define DREMEL_PREDICT_FALSE(x) (x)
#define DREMEL_PREDICT_TRUE(x) (x)
#else
#define DREMEL_NORETURN
#define DREMEL_NOINLINE
#define DREMEL_FORCE_INLINE inline
#define DREMEL_PREDICT_FALSE(x) (x)
#define DREMEL_PREDICT_TRUE(x) (x)
#endif

#if defined(__clang__)
#define DREMEL_MUST_USE_TYPE [[nodiscard]]
#else
#define DREMEL_MUST_USE_TYPE
#endif
