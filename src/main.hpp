// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

namespace elastic {

// Shuts down the window system and exits the program with an error status
// code. Called after a fatal error has been logged.
[[noreturn]]
void ExitError();

} // namespace elastic
