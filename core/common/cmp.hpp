/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * Defines == and != of T by comparing tuples returned by fields(const T &),
 * which is found by ADL in namespace of T
 */
#define SCV_COMPARE_FIELDS(T)                      \
  inline bool operator==(const T &l, const T &r) { \
    return fields(l) == fields(r);                 \
  }                                                \
  inline bool operator!=(const T &l, const T &r) { \
    return !(l == r);                              \
  }
