// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string>
#include <string_view>

namespace elastic {

namespace var {

// Variable traits, which describe operations on variables of the given type.
template <typename T>
struct VarTraits {
	using Storage = T;
	using Value = T;
};

// A string variable is accessed through a string view.
template <>
struct VarTraits<std::string> {
	using Storage = std::string;
	using Value = std::string_view;
};

// Configurable variable.
template <typename T>
class Var {
public:
	using Traits = VarTraits<T>;
	using Storage = typename Traits::Storage;
	using Value = typename Traits::Value;

	explicit Var(Value defaultValue) : mStorage{defaultValue} {}

	Value get() const { return mStorage; }
	void set(Value value) { mStorage = value; }

private:
	Storage mStorage;
};

#define DEFVAR(name, type, defaultValue, description) extern Var<type> name;
#include "var_def.hpp"
#undef DEFVAR

} // namespace var

// Parse the program's command-line arguments. Each argument has the form
// name=value. Fails on unknown names or invalid values.
void ParseCommandArguments(int argCount, char **args);

} // namespace elastic
