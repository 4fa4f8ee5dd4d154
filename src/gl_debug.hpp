// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

namespace elastic {
namespace gl_debug {

// Forward OpenGL debug messages to the log, if the context supports it.
// Requires a debug context to receive anything useful.
void Init();

} // namespace gl_debug
} // namespace elastic
