#include "metrics_http_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <cstring>
#include <errno.h>
#include <sstream>

#include <glog/logging.h>

#include "text_exposition.h"

namespace Chopsticks {

namespace {

const char kIndexPage[] =
	"<html>\n"
	"<head><title>Chopsticks Metrics</title></head>\n"
	"<body>\n"
	"<h1>Chopsticks Metrics Exporter</h1>\n"
	"<p><a href=\"/metrics\">Metrics endpoint</a></p>\n"
	"</body>\n"
	"</html>\n";

// Requests larger than this are not scrapes
constexpr size_t kMaxRequestBytes = 8192;

const char* ReasonPhrase(int status) {
	switch (status) {
		case 200: return "OK";
		case 400: return "Bad Request";
		case 404: return "Not Found";
		case 405: return "Method Not Allowed";
		default: return "Internal Server Error";
	}
}

bool SendAll(int fd, const std::string& data) {
	size_t sent = 0;
	while (sent < data.size()) {
		ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
		if (n < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		sent += static_cast<size_t>(n);
	}
	return true;
}

} // namespace

MetricsHttpServer::MetricsHttpServer(std::string host, int port, SummaryProvider provider)
	: host_(std::move(host)),
	port_(port),
	provider_(std::move(provider)) {}

MetricsHttpServer::~MetricsHttpServer() {
	Stop();
}

bool MetricsHttpServer::Start() {
	server_fd_.Reset(socket(AF_INET, SOCK_STREAM, 0));
	if (!server_fd_.valid()) {
		LOG(ERROR) << "[MetricsHttpServer] Socket creation failed: " << strerror(errno);
		return false;
	}

	int flag = 1;
	if (setsockopt(server_fd_.get(), SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag)) < 0) {
		LOG(ERROR) << "[MetricsHttpServer] setsockopt(SO_REUSEADDR) failed: " << strerror(errno);
		return false;
	}

	struct sockaddr_in server_address;
	memset(&server_address, 0, sizeof(server_address));
	server_address.sin_family = AF_INET;
	server_address.sin_port = htons(static_cast<uint16_t>(port_));
	std::string host = host_ == "localhost" ? "127.0.0.1" : host_;
	if (inet_pton(AF_INET, host.c_str(), &server_address.sin_addr) != 1) {
		LOG(ERROR) << "[MetricsHttpServer] Invalid listen address " << host_;
		return false;
	}

	// No retry: a taken port means another run is exposing metrics here
	if (bind(server_fd_.get(), (struct sockaddr*)&server_address, sizeof(server_address)) < 0) {
		LOG(ERROR) << "[MetricsHttpServer] Error binding to " << host_ << ":" << port_
			<< ": " << strerror(errno);
		return false;
	}
	if (listen(server_fd_.get(), SOMAXCONN) == -1) {
		LOG(ERROR) << "[MetricsHttpServer] Error starting listener: " << strerror(errno);
		return false;
	}

	socklen_t len = sizeof(server_address);
	if (getsockname(server_fd_.get(), (struct sockaddr*)&server_address, &len) == 0) {
		port_ = ntohs(server_address.sin_port);
	}

	epoll_fd_.Reset(epoll_create1(0));
	if (!epoll_fd_.valid()) {
		LOG(ERROR) << "[MetricsHttpServer] epoll_create1 failed: " << strerror(errno);
		return false;
	}
	struct epoll_event event;
	event.events = EPOLLIN;
	event.data.fd = server_fd_.get();
	if (epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, server_fd_.get(), &event) == -1) {
		LOG(ERROR) << "[MetricsHttpServer] epoll_ctl failed: " << strerror(errno);
		return false;
	}

	stop_threads_ = false;
	main_thread_ = std::thread([this]() {
			this->MainThread();
			});
	LOG(INFO) << "[MetricsHttpServer] serving http://" << host_ << ":" << port_ << "/metrics";
	return true;
}

void MetricsHttpServer::Stop() {
	stop_threads_ = true;
	if (main_thread_.joinable()) {
		main_thread_.join();
		LOG(INFO) << "[MetricsHttpServer] stopped";
	}
	epoll_fd_.Reset();
	server_fd_.Reset();
}

void MetricsHttpServer::MainThread() {
	const int MAX_EVENTS = 16;
	struct epoll_event events[MAX_EVENTS];
	const int EPOLL_TIMEOUT_MS = 100;

	while (!stop_threads_) {
		int n = epoll_wait(epoll_fd_.get(), events, MAX_EVENTS, EPOLL_TIMEOUT_MS);
		if (n < 0 && errno != EINTR) {
			LOG(ERROR) << "[MetricsHttpServer] epoll_wait failed: " << strerror(errno);
			break;
		}
		for (int i = 0; i < n; i++) {
			if (events[i].data.fd != server_fd_.get()) {
				continue;
			}
			struct sockaddr_in client_addr;
			socklen_t client_addr_len = sizeof(client_addr);
			ScopedFd client(accept(server_fd_.get(), (struct sockaddr*)&client_addr, &client_addr_len));
			if (!client.valid()) {
				LOG(ERROR) << "[MetricsHttpServer] Error accepting connection: " << strerror(errno);
				continue;
			}
			ServeConnection(client.get());
		}
	}
}

void MetricsHttpServer::ServeConnection(int client_fd) {
	// A stuck client must not hold up the next scrape for long
	struct timeval timeout;
	timeout.tv_sec = 2;
	timeout.tv_usec = 0;
	setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

	std::string request;
	char buf[1024];
	while (request.find("\r\n\r\n") == std::string::npos &&
			request.find("\n\n") == std::string::npos && request.size() < kMaxRequestBytes) {
		ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
		if (n < 0 && errno == EINTR) continue;
		if (n <= 0) break;
		request.append(buf, static_cast<size_t>(n));
	}

	HttpResponse response;
	std::istringstream line(request.substr(0, request.find('\n')));
	std::string method, target;
	if (!(line >> method >> target)) {
		response.status = 400;
		response.content_type = "text/plain";
		response.body = "Bad Request\n";
	} else {
		response = Handle(method, target);
	}
	VLOG(2) << "[MetricsHttpServer] " << method << " " << target << " -> " << response.status;

	std::ostringstream out;
	out << "HTTP/1.0 " << response.status << " " << ReasonPhrase(response.status) << "\r\n";
	if (!response.content_type.empty()) {
		out << "Content-Type: " << response.content_type << "\r\n";
	}
	if (response.status == 405) {
		out << "Allow: GET\r\n";
	}
	out << "Content-Length: " << response.body.size() << "\r\n";
	out << "Connection: close\r\n\r\n";
	out << response.body;
	if (!SendAll(client_fd, out.str())) {
		LOG(WARNING) << "[MetricsHttpServer] failed to send response: " << strerror(errno);
	}
}

HttpResponse MetricsHttpServer::Handle(const std::string& method, const std::string& path) const {
	HttpResponse response;
	std::string route = path.substr(0, path.find('?'));
	if (method != "GET") {
		response.status = 405;
		response.content_type = "text/plain";
		response.body = "Method Not Allowed\n";
	} else if (route == "/metrics") {
		response.content_type = kExpositionContentType;
		response.body = RenderTextExposition(provider_());
	} else if (route == "/") {
		response.content_type = "text/html";
		response.body = kIndexPage;
	} else {
		response.status = 404;
		response.content_type = "text/plain";
		response.body = "Not Found\n";
	}
	return response;
}

} // End of namespace Chopsticks
