#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>

namespace httplib {
class Server;
} // namespace httplib

class Orchestrator;

// Routes:
//   POST /submit     {requestor, language, code, timeout_ms?} -> result
//   POST /message    {requestor, content} -> {reply, result}
//   GET  /languages  -> [{name, aliases, image, command, limits}]
//   GET  /status     -> {active, queued, capacity, stopped}
void SetupServer(httplib::Server&, Orchestrator&);

// Blocks until server.stop() is called; false if the address cannot be bound.
bool ServeForever(httplib::Server&, const std::string& host, int port);

#endif  // SERVER_IO_H_
