// File: CombatConnection.hpp
// Description: Manages a single client's WebSocket connection: async reads,
// the ordered write queue, and routing of COMBAT_* commands to the service.
#pragma once

#include "CombatService.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class CombatConnection;

// Live connections, for shutdown warnings. Keyed by connection id.
extern std::map<int, std::weak_ptr<CombatConnection>> g_connection_registry;
extern std::mutex g_connection_registry_mutex;
extern std::atomic<int> g_connection_id_counter;

class CombatConnection : public std::enable_shared_from_this<CombatConnection>
{
	// --- Networking Members ---
	websocket::stream<tcp::socket> ws_;
	beast::flat_buffer buffer_;
	std::string client_address_;
	int connection_id_ = 0;

	// Owned by the strand.
	std::queue<std::shared_ptr<std::string>> write_queue_;
	bool is_writing_ = false;

	std::shared_ptr<CombatService> service_;
	std::shared_ptr<net::thread_pool> combat_pool_; // blocking service calls run here

public:
	CombatConnection(tcp::socket socket, std::shared_ptr<CombatService> service, std::shared_ptr<net::thread_pool> combat_pool);
	~CombatConnection() noexcept;

	void run();
	void send(std::string message);
	void send_shutdown_warning(int seconds);
	void disconnect();

private:
	void on_run();
	void do_read();
	void on_read(beast::error_code ec, std::size_t bytes_transferred);
	void do_async_write();
	void on_write(beast::error_code ec, std::size_t bytes_transferred);
	void on_session_end();

	/**
	 * @brief The router for all incoming client messages.
	 * Frames look like COMMAND:{json}; every reply is SERVER:<EVENT>:{json}.
	 */
	void handle_message(const std::string& message);

	// Runs job on the combat pool. Any CombatError becomes SERVER:ERROR:{code,message}.
	void dispatch_to_pool(const std::string& command, std::function<std::string()> job);
};
