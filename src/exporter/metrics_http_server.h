#ifndef CHOPSTICKS_EXPORTER_METRICS_HTTP_SERVER_H_
#define CHOPSTICKS_EXPORTER_METRICS_HTTP_SERVER_H_

#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "common/scoped_fd.h"
#include "metrics/summary.h"

namespace Chopsticks {

struct HttpResponse {
	int status = 200;
	std::string content_type;
	std::string body;
};

/**
 * Minimal HTTP/1.0 endpoint for live scraping. GET /metrics renders a fresh
 * Summary, GET / serves an index page. One request per connection, served
 * on the listener thread.
 */
class MetricsHttpServer {
	public:
		using SummaryProvider = std::function<Summary()>;

		MetricsHttpServer(std::string host, int port, SummaryProvider provider);
		~MetricsHttpServer();

		/// Binds and starts serving. False when the socket could not be set up,
		/// which callers treat as fatal. Port 0 picks a free port.
		bool Start();
		void Stop();

		/// Bound port, valid after Start()
		int port() const { return port_; }

		HttpResponse Handle(const std::string& method, const std::string& path) const;

	private:
		void MainThread();
		void ServeConnection(int client_fd);

		const std::string host_;
		int port_;
		SummaryProvider provider_;

		ScopedFd server_fd_;
		ScopedFd epoll_fd_;
		std::thread main_thread_;
		std::atomic<bool> stop_threads_{false};
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_EXPORTER_METRICS_HTTP_SERVER_H_
