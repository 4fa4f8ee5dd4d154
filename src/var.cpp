// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "var.hpp"

#include "log.hpp"

#include <charconv>
#include <optional>

namespace elastic {

namespace var {

#define DEFVAR(name, type, defaultValue, description) \
	Var<type> name{defaultValue};
#include "var_def.hpp"
#undef DEFVAR

} // namespace var

namespace {

std::optional<bool> ParseBool(std::string_view value) {
	if (value == "0" || value == "n" || value == "no" || value == "off" ||
	    value == "false") {
		return false;
	}
	if (value == "1" || value == "y" || value == "yes" || value == "on" ||
	    value == "true") {
		return true;
	}
	return std::nullopt;
}

// Parse a positive decimal integer.
std::optional<int> ParsePositiveInt(std::string_view value) {
	int result;
	const char *end = value.data() + value.size();
	std::from_chars_result r = std::from_chars(value.data(), end, result);
	if (r.ec != std::errc{} || r.ptr != end || result <= 0) {
		return std::nullopt;
	}
	return result;
}

// Kinds of variable data.
enum class Kind {
	Bool,
	Int,
	String,
};

// Definition for a configuration variable.
class VarDefinition {
public:
	VarDefinition(std::string_view name, var::Var<bool> *value)
		: mName{name}, mKind{Kind::Bool} {
		mData.boolVar = value;
	}
	VarDefinition(std::string_view name, var::Var<int> *value)
		: mName{name}, mKind{Kind::Int} {
		mData.intVar = value;
	}
	VarDefinition(std::string_view name, var::Var<std::string> *value)
		: mName{name}, mKind{Kind::String} {
		mData.stringVar = value;
	}

	std::string_view name() const { return mName; }

	void Set(std::string_view string) const {
		switch (mKind) {
		case Kind::Bool: {
			std::optional<bool> parsed = ParseBool(string);
			if (!parsed.has_value()) {
				FAIL("Invalid boolean.", log::Attr{"var", mName},
				     log::Attr{"value", string});
			}
			mData.boolVar->set(*parsed);
		} break;
		case Kind::Int: {
			std::optional<int> parsed = ParsePositiveInt(string);
			if (!parsed.has_value()) {
				FAIL("Invalid positive integer.", log::Attr{"var", mName},
				     log::Attr{"value", string});
			}
			mData.intVar->set(*parsed);
		} break;
		case Kind::String:
			mData.stringVar->set(string);
			break;
		}
	}

private:
	std::string_view mName;
	Kind mKind;
	union {
		var::Var<bool> *boolVar;
		var::Var<int> *intVar;
		var::Var<std::string> *stringVar;
	} mData;
};

const VarDefinition VarDefinitions[] = {
#define DEFVAR(name, type, defaultValue, description) {#name, &var::name},
#include "var_def.hpp"
#undef DEFVAR
};

const VarDefinition *LookupVar(std::string_view name) {
	for (const VarDefinition &definition : VarDefinitions) {
		if (definition.name() == name) {
			return &definition;
		}
	}
	return nullptr;
}

} // namespace

void ParseCommandArguments(int argCount, char **args) {
	for (int i = 0; i < argCount; i++) {
		const std::string_view arg = args[i];
		const std::size_t pos = arg.find('=');
		if (pos == std::string_view::npos) {
			FAIL("Invalid command-line argument syntax.",
			     log::Attr{"argument", arg});
		}
		const std::string_view name = arg.substr(0, pos);
		const VarDefinition *definition = LookupVar(name);
		if (definition == nullptr) {
			FAIL("Command-line contains a value for an unknown variable.",
			     log::Attr{"name", name});
		}
		definition->Set(arg.substr(pos + 1));
	}
}

} // namespace elastic
