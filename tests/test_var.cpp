// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "test_support.hpp"
#include "var.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace elastic;

namespace {

// Restores the variables changed by the tests.
struct VarReset {
	~VarReset() {
		var::Mesh.set("box");
		var::WindowWidth.set(1280);
		var::WindowHeight.set(720);
		var::VSync.set(true);
		var::DebugContext.set(false);
	}
};

} // namespace

TEST_CASE("Variable defaults", "[var]") {
	REQUIRE(var::Mesh.get() == "box");
	REQUIRE(var::WindowWidth.get() == 1280);
	REQUIRE(var::WindowHeight.get() == 720);
	REQUIRE(var::VSync.get());
	REQUIRE_FALSE(var::DebugContext.get());
	REQUIRE(var::ProjectPath.get().empty());
}

TEST_CASE("Command-line arguments", "[var]") {
	VarReset reset;

	SECTION("values are parsed by type") {
		char arg0[] = "Mesh=sphere";
		char arg1[] = "WindowWidth=640";
		char arg2[] = "VSync=off";
		char arg3[] = "DebugContext=yes";
		char *args[] = {arg0, arg1, arg2, arg3};
		ParseCommandArguments(4, args);
		REQUIRE(var::Mesh.get() == "sphere");
		REQUIRE(var::WindowWidth.get() == 640);
		REQUIRE_FALSE(var::VSync.get());
		REQUIRE(var::DebugContext.get());
	}

	SECTION("missing equals sign is fatal") {
		char arg0[] = "Mesh";
		char *args[] = {arg0};
		REQUIRE_THROWS_AS(ParseCommandArguments(1, args), test::FatalError);
	}

	SECTION("unknown variable is fatal") {
		char arg0[] = "Shape=box";
		char *args[] = {arg0};
		REQUIRE_THROWS_AS(ParseCommandArguments(1, args), test::FatalError);
	}

	SECTION("invalid boolean is fatal") {
		char arg0[] = "VSync=maybe";
		char *args[] = {arg0};
		REQUIRE_THROWS_AS(ParseCommandArguments(1, args), test::FatalError);
	}

	SECTION("window size must be positive") {
		char arg0[] = "WindowHeight=0";
		char arg1[] = "WindowHeight=12px";
		char *args0[] = {arg0};
		char *args1[] = {arg1};
		REQUIRE_THROWS_AS(ParseCommandArguments(1, args0), test::FatalError);
		REQUIRE_THROWS_AS(ParseCommandArguments(1, args1), test::FatalError);
		REQUIRE(var::WindowHeight.get() == 720);
	}
}
