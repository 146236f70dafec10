#pragma once

namespace urlcodec {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored result/error output).
bool IsStdoutTty();

/// Returns true if stdin is a terminal. Input is never read from a terminal.
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve --color/--no-color against NO_COLOR and whether the stream is a tty.
bool ResolveColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace urlcodec
