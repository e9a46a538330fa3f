#pragma once

#include "mdns.h"
#include "mdns_discovery/log.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <unistd.h>

#include <fmt/core.h>

namespace mdns_discovery
{

inline std::string IPV4AddressToString(const sockaddr_in *addr, size_t addrlen) {
  char host[NI_MAXHOST] = {0};
  char service[NI_MAXSERV] = {0};
  const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
  if (ret == 0) {
    if (addr->sin_port != 0) {
	  return fmt::format("{}:{}", host, service);
    } else {
	  return fmt::format("{}", host);
    }
  }
  return "";
}

inline std::string ExtractName(const void* data, size_t size, size_t offset)
{
	char namebuffer[256];
	const mdns_string_t name = mdns_string_extract(data, size, &offset, namebuffer, sizeof(namebuffer));
	return std::string(name.str, name.length);
}

// Client sockets for one browse or one resolution, closed on destruction.
// When sending, each socket can only send to one network interface, so
// there is one socket per IPv4 interface.
class ClientSockets
{
public:
	explicit ClientSockets(std::size_t max_sockets)
	{
		struct ifaddrs* ifaddr = nullptr;
		if (getifaddrs(&ifaddr) < 0) {
			Log(LogLevel::Warn, fmt::format("Unable to get interface addresses: {}", strerror(errno)));
			return;
		}

		for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
			if (m_sockets.size() >= max_sockets)
				break;
			if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
				continue;
			if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST))
				continue;
			if ((ifa->ifa_flags & IFF_LOOPBACK) || (ifa->ifa_flags & IFF_POINTOPOINT))
				continue;

			struct sockaddr_in saddr;
			memcpy(&saddr, ifa->ifa_addr, sizeof(saddr));
			if (saddr.sin_addr.s_addr == htonl(INADDR_LOOPBACK))
				continue;

			saddr.sin_port = 0;
			const int sock = mdns_socket_open_ipv4(&saddr);
			if (sock >= 0) {
				m_sockets.push_back(sock);
				Log(LogLevel::Debug, "Socket opened for interface with local IPv4 address: " + IPV4AddressToString(&saddr, sizeof(saddr)));
			}
		}

		freeifaddrs(ifaddr);
	}

	~ClientSockets()
	{
		Close();
	}

	ClientSockets(const ClientSockets&) = delete;
	ClientSockets& operator=(const ClientSockets&) = delete;

	void Close()
	{
		for (const auto sock : m_sockets) {
			mdns_socket_close(sock);
		}
		m_sockets.clear();
	}

	// Sends the query on every socket, returns how many sends succeeded
	std::size_t SendQuery(mdns_record_type_t type, const std::string& name)
	{
		std::array<char, 2048> buffer;
		std::size_t sent = 0;
		for (const auto sock : m_sockets) {
			if (mdns_query_send(sock, type, name.data(), name.size(), buffer.data(), buffer.size(), 0) < 0) {
				Log(LogLevel::Warn, fmt::format("Failed to send mDNS query for {}: {}", name, strerror(errno)));
			} else {
				++sent;
			}
		}
		return sent;
	}

	// Waits up to timeout for replies and feeds every readable socket to
	// callback. Returns -1 when select() fails, else the number of ready sockets.
	int ReadReplies(std::chrono::microseconds timeout, mdns_record_callback_fn callback, void* user_data)
	{
		struct timeval tv;
		tv.tv_sec = static_cast<long>(timeout.count() / 1000000);
		tv.tv_usec = static_cast<long>(timeout.count() % 1000000);

		int nfds = 0;
		fd_set readfs;
		FD_ZERO(&readfs);
		for (const auto sock : m_sockets) {
			if (sock >= nfds)
				nfds = sock + 1;
			FD_SET(sock, &readfs);
		}

		const int ready = select(nfds, &readfs, nullptr, nullptr, &tv);
		if (ready > 0) {
			std::array<char, 2048> buffer;
			for (const auto sock : m_sockets) {
				if (FD_ISSET(sock, &readfs)) {
					mdns_query_recv(sock, buffer.data(), buffer.size(), callback, user_data, 0);
				}
			}
		}
		return ready;
	}

	[[nodiscard]] bool Empty() const { return m_sockets.empty(); }
	[[nodiscard]] std::size_t Size() const { return m_sockets.size(); }

private:
	std::vector<int> m_sockets;
};

}
