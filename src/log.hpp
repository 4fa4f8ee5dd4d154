// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// Entry points for logging. This is modeled after Go's log/slog package.

#include "log_standard.hpp"

/// <summary>
/// Write a message to the log. Takes a message and an optional list of
/// attributes, such as <see cref="log::elastic::Attr"/>.
/// </summary>
/// <example>
/// Log a click position with the attribute <c>point=(1,2,3)</c>.
/// <code>
/// glm::vec3 point{1.0f, 2.0f, 3.0f};
/// LOG(Debug, "Click hit mesh.", log::Attr{"point", point});
/// </code>
/// </example>
#define LOG(level, ...) \
	::elastic::log::Record{::elastic::log::Level::level, LOG_LOCATION, \
	                       __VA_ARGS__} \
		.Log()

/// <summary>
/// Check that a condition is true. If not, show an error message and exit the
/// program. Attributes can be added to the message, as with <see cref="LOG"/>.
/// This behaves like assert().
/// </summary>
#define CHECK(condition) \
	(void)((!!(condition)) || \
	       (::elastic::log::Record::CheckFailure(LOG_LOCATION, #condition) \
	            .Fail(), \
	        0))

/// <summary>
/// Show an error message and exit the program.
/// </summary>
/// <example>
/// Exit the program with a message about a shader that failed to compile.
/// <code>
/// FAIL("Shader failed to compile.", log::Attr{"file", "wave.frag"});
/// </code>
/// </example>
#define FAIL(...) \
	::elastic::log::Record{::elastic::log::Level::Error, LOG_LOCATION, \
	                       __VA_ARGS__} \
		.Fail()
