// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>

#include <unistd.h>

namespace ember {

bool is_terminal(int fd) {
    return isatty(fd);
}

bool is_terminal_stdout() {
    return is_terminal(fileno(stdout));
}

bool is_terminal_stderr() {
    return is_terminal(fileno(stderr));
}

}  // namespace ember
