//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Entry point for the "pxeboot_tests" executable

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
