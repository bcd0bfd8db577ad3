#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <cstddef>
#include <istream>
#include <ostream>

class SessionBinder;

// requests handled at the same time; 0 = no limit
extern size_t kMaxQueue;

// Line-delimited JSON: one request per input line, one response per output line.
// Each request runs on its own thread, so responses may come out of order;
// the "id" of a request is copied into its response.
// While kMaxQueue requests are in flight, no further input is read.
// Returns after the input is closed and every request has been answered.
void ServerWorkLoop(std::istream& in, std::ostream& out, SessionBinder& binder);

#endif  // SERVER_IO_H_
