// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
