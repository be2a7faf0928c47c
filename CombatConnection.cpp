// File: CombatConnection.cpp
// Description: WebSocket I/O and COMBAT_* command routing.
#include "CombatConnection.hpp"
#include "CombatJson.hpp"
#include <boost/asio/post.hpp>
#include <boost/core/ignore_unused.hpp>
#include <nlohmann/json.hpp>
#include <iostream>

std::map<int, std::weak_ptr<CombatConnection>> g_connection_registry;
std::mutex g_connection_registry_mutex;
std::atomic<int> g_connection_id_counter{ 1 };

using json = nlohmann::json;

/**
 * @brief Constructs the connection, moving the socket into the WebSocket stream.
 */
CombatConnection::CombatConnection(tcp::socket socket, std::shared_ptr<CombatService> service,
	std::shared_ptr<net::thread_pool> combat_pool)
	: ws_(std::move(socket))
	, client_address_(ws_.next_layer().remote_endpoint().address().to_string())
	, connection_id_(g_connection_id_counter++)
	, service_(std::move(service))
	, combat_pool_(std::move(combat_pool))
{
	std::cout << "--- New Client Connected from: " << client_address_ << " ---" << std::endl;
}

CombatConnection::~CombatConnection() noexcept
{
	std::lock_guard<std::mutex> lock(g_connection_registry_mutex);
	g_connection_registry.erase(connection_id_);
}

/**
 * @brief Starts the connection by posting on_run to the strand.
 */
void CombatConnection::run()
{
	net::dispatch(ws_.get_executor(),
		[self = shared_from_this()]()
		{
			self->on_run();
		});
}

/**
 * @brief Performs the WebSocket handshake.
 */
void CombatConnection::on_run()
{
	ws_.async_accept(
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this()](beast::error_code ec)
			{
				if (ec)
				{
					std::cerr << "[" << self->client_address_ << "] Handshake Error: " << ec.message() << "\n";
					return self->on_session_end();
				}

				std::cout << "[" << self->client_address_ << "] Handshake successful. Connection started.\n";

				{
					std::lock_guard<std::mutex> lock(g_connection_registry_mutex);
					g_connection_registry[self->connection_id_] = self->shared_from_this();
				}

				self->send("SERVER:WELCOME:{}");
				self->do_read();
			}));
}

void CombatConnection::do_read()
{
	ws_.async_read(buffer_,
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this()](beast::error_code ec, std::size_t bytes)
			{
				self->on_read(ec, bytes);
			}));
}

void CombatConnection::on_read(beast::error_code ec, std::size_t bytes_transferred)
{
	boost::ignore_unused(bytes_transferred);

	if (ec == websocket::error::closed || ec == net::error::eof || ec == net::error::operation_aborted)
		return on_session_end();

	if (ec)
	{
		std::cerr << "[" << client_address_ << "] Read Error: " << ec.message() << "\n";
		return on_session_end();
	}

	std::string message = beast::buffers_to_string(buffer_.data());
	std::cout << "[" << client_address_ << "] Received: " << message << "\n";

	handle_message(message);

	buffer_.consume(buffer_.size());
	do_read();
}

// --- ASYNC WRITE QUEUE ---

/**
 * @brief Adds the message to the queue and starts the write loop if idle.
 * Safe to call from any thread.
 */
void CombatConnection::send(std::string message)
{
	auto shared_msg = std::make_shared<std::string>(std::move(message));

	net::dispatch(ws_.get_executor(),
		[self = shared_from_this(), shared_msg]()
		{
			self->write_queue_.push(shared_msg);
			if (!self->is_writing_)
			{
				self->do_async_write();
			}
		});
}

// Always called from within the strand.
void CombatConnection::do_async_write()
{
	is_writing_ = true;
	auto msg = write_queue_.front();

	ws_.async_write(net::buffer(*msg),
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this(), msg](beast::error_code ec, std::size_t bytes)
			{
				self->on_write(ec, bytes);
			}));
}

void CombatConnection::on_write(beast::error_code ec, std::size_t bytes_transferred)
{
	boost::ignore_unused(bytes_transferred);

	if (ec == websocket::error::closed || ec == net::error::eof || ec == net::error::operation_aborted)
		return on_session_end();

	if (ec)
	{
		std::cerr << "[" << client_address_ << "] Write Error: " << ec.message() << "\n";
		return on_session_end();
	}

	write_queue_.pop();

	if (!write_queue_.empty())
	{
		do_async_write();
	}
	else
	{
		is_writing_ = false;
	}
}
// --- END ASYNC WRITE QUEUE ---

void CombatConnection::dispatch_to_pool(const std::string& command, std::function<std::string()> job)
{
	auto self = shared_from_this();

	// Returns immediately; the service call (locks, database, settlement) runs on the pool.
	net::post(*combat_pool_, [self, command, job] {
		std::string reply;
		try {
			reply = job();
		}
		catch (const CombatError& e) {
			std::cerr << "[" << self->client_address_ << "] " << command << " failed (" << e.code() << "): " << e.what() << std::endl;
			reply = "SERVER:ERROR:" + errorPayload(e).dump();
		}
		catch (const nlohmann::json::exception& e) {
			reply = "SERVER:ERROR:" + json{ {"code", "VALIDATION_ERROR"}, {"message", std::string("Malformed payload: ") + e.what()} }.dump();
		}
		catch (const std::exception& e) {
			std::cerr << "[" << self->client_address_ << "] " << command << " internal error: " << e.what() << std::endl;
			reply = "SERVER:ERROR:" + json{ {"code", "INTERNAL_ERROR"}, {"message", "An internal error occurred."} }.dump();
		}
		self->send(std::move(reply));
	});
}

void CombatConnection::handle_message(const std::string& message)
{
	const auto sep = message.find(':');
	const std::string command = message.substr(0, sep);
	const std::string body = sep == std::string::npos ? "{}" : message.substr(sep + 1);

	json payload;
	try {
		payload = json::parse(body);
	}
	catch (const json::parse_error& e) {
		send("SERVER:ERROR:" + json{ {"code", "VALIDATION_ERROR"}, {"message", std::string("Invalid JSON: ") + e.what()} }.dump());
		return;
	}
	if (!payload.is_object()) {
		send("SERVER:ERROR:" + json{ {"code", "VALIDATION_ERROR"}, {"message", "Payload must be a JSON object"} }.dump());
		return;
	}

	auto service = service_;

	if (command == "COMBAT_START") {
		dispatch_to_pool(command, [service, payload] {
			SessionSummary summary = service->startCombat(
				payload.at("userId").get<std::string>(),
				payload.at("locationId").get<std::string>(),
				payload.value("combatLevel", 1));
			return "SERVER:COMBAT_STARTED:" + json(summary).dump();
		});
	}
	else if (command == "COMBAT_ATTACK") {
		dispatch_to_pool(command, [service, payload] {
			TurnResult result = service->submitAttack(
				payload.at("sessionId").get<std::string>(),
				payload.at("tapDegrees").get<double>());
			return "SERVER:COMBAT_TURN:" + json(result).dump();
		});
	}
	else if (command == "COMBAT_DEFEND") {
		dispatch_to_pool(command, [service, payload] {
			TurnResult result = service->submitDefend(
				payload.at("sessionId").get<std::string>(),
				payload.at("defenseTapDegrees").get<double>());
			return "SERVER:COMBAT_TURN:" + json(result).dump();
		});
	}
	else if (command == "COMBAT_COMPLETE") {
		dispatch_to_pool(command, [service, payload] {
			RewardBundle bundle = service->completeCombat(payload.at("sessionId").get<std::string>());
			return "SERVER:COMBAT_REWARDS:" + json(bundle).dump();
		});
	}
	else if (command == "COMBAT_ABANDON") {
		dispatch_to_pool(command, [service, payload] {
			std::string sessionId = payload.at("sessionId").get<std::string>();
			service->abandonCombat(sessionId);
			return "SERVER:COMBAT_ABANDONED:" + json{ {"sessionId", sessionId} }.dump();
		});
	}
	else if (command == "COMBAT_GET") {
		dispatch_to_pool(command, [service, payload] {
			if (payload.contains("sessionId")) {
				return "SERVER:COMBAT_SESSION:" + json(service->getCombatSession(payload.at("sessionId").get<std::string>())).dump();
			}
			auto active = service->getUserActiveSession(payload.at("userId").get<std::string>());
			return "SERVER:COMBAT_SESSION:" + (active ? json(*active) : json(nullptr)).dump();
		});
	}
	else {
		send("SERVER:ERROR:" + json{ {"code", "VALIDATION_ERROR"}, {"message", "Unknown command: " + command} }.dump());
	}
}

void CombatConnection::on_session_end()
{
	{
		std::lock_guard<std::mutex> lock(g_connection_registry_mutex);
		g_connection_registry.erase(connection_id_);
	}

	// Combat sessions outlive the socket; a reconnecting client resumes with COMBAT_GET.
	std::cout << "[" << client_address_ << "] Client disconnected.\n";
}

void CombatConnection::send_shutdown_warning(int seconds)
{
	send("SERVER:SHUTDOWN:" + json{ {"seconds", seconds} }.dump());
}

void CombatConnection::disconnect()
{
	net::dispatch(ws_.get_executor(),
		[self = shared_from_this()]()
		{
			beast::error_code ec;
			self->ws_.close(websocket::close_code::service_restart, ec);
		});
}
