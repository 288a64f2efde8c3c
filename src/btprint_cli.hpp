#pragma once

namespace btprint
{
// Entry point of the btprint tool. Returns 0 on success, 1 when the printer
// could not be reached or written, 2 on usage errors.
int realMain(int argc, char *argv[]);
} // namespace btprint
