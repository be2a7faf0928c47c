// ==========================================
// File: server_main.cpp
// Description: Entry point for the combat server.
// Handles networking, DB connections, the expiry sweep, and graceful shutdown.
// ==========================================

#include "CombatConnection.hpp"
#include "CombatService.hpp"
#include "DatabaseManager.hpp"
#include "PgRepositories.hpp"
#include "SessionStore.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <random>
#include <thread>
#include <vector>
#include <chrono>
#include <sodium.h>
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ==========================================
// Listener Class
// ==========================================
class listener : public std::enable_shared_from_this<listener>
{
	net::io_context& ioc_;
	tcp::acceptor acceptor_;
	std::shared_ptr<CombatService> service_;
	std::shared_ptr<net::thread_pool> combat_pool_;

public:
	listener(net::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<CombatService> service, std::shared_ptr<net::thread_pool> combat_pool)
		: ioc_(ioc), acceptor_(ioc), service_(std::move(service)), combat_pool_(std::move(combat_pool))
	{
		boost::system::error_code ec;

		acceptor_.open(endpoint.protocol(), ec);
		if (ec) throw std::runtime_error("Listener open: " + ec.message());

		acceptor_.set_option(net::socket_base::reuse_address(true), ec);
		if (ec) throw std::runtime_error("Listener set_option: " + ec.message());

		acceptor_.bind(endpoint, ec);
		if (ec) throw std::runtime_error("Listener bind: " + ec.message());

		acceptor_.listen(net::socket_base::max_listen_connections, ec);
		if (ec) throw std::runtime_error("Listener listen: " + ec.message());
	}

	void run() { do_accept(); }

	void stop()
	{
		net::dispatch(acceptor_.get_executor(), [self = shared_from_this()]() {
			boost::system::error_code ec;
			self->acceptor_.close(ec);
			});
	}

private:
	void do_accept()
	{
		acceptor_.async_accept(
			net::make_strand(ioc_),
			[self = shared_from_this()](boost::system::error_code ec, tcp::socket socket)
			{
				if (ec == net::error::operation_aborted) return; // acceptor closed

				if (!ec)
				{
					std::make_shared<CombatConnection>(
						std::move(socket),
						self->service_,
						self->combat_pool_
					)->run();
				}
				else
				{
					std::cerr << "[ACCEPT ERROR] " << ec.message() << std::endl;
				}

				self->do_accept();
			});
	}
};

// ==========================================
// Expiry Sweep Timer
// ==========================================
void run_session_sweep_timer(net::steady_timer& timer, std::shared_ptr<CombatService> service, int interval_seconds)
{
	timer.expires_after(std::chrono::seconds(interval_seconds));

	timer.async_wait([&timer, service, interval_seconds](const boost::system::error_code& ec)
		{
			if (ec)
			{
				if (ec != net::error::operation_aborted)
					std::cerr << "[SESSION SWEEP TIMER ERROR] " << ec.message() << std::endl;
				return;
			}

			try {
				service->purgeExpiredSessions();
			}
			catch (const std::exception& e) {
				std::cerr << "[SESSION SWEEP ERROR] " << e.what() << std::endl;
			}

			// Re-arm timer
			run_session_sweep_timer(timer, service, interval_seconds);
		});
}

// --config <path> wins over COMBAT_CONFIG; neither means compiled defaults.
static CombatConfig load_config(int argc, char* argv[])
{
	std::string path;
	for (int i = 1; i + 1 < argc; ++i)
	{
		if (std::string(argv[i]) == "--config") path = argv[i + 1];
	}
	if (path.empty())
	{
		if (const char* env = std::getenv("COMBAT_CONFIG")) path = env;
	}

	CombatConfig config = path.empty() ? CombatConfig{} : loadCombatConfig(path);
	if (config.databaseUrl.empty())
	{
		if (const char* env = std::getenv("COMBAT_DATABASE_URL")) config.databaseUrl = env;
	}
	if (config.databaseUrl.empty())
		throw std::runtime_error("No database configured: set database_url or COMBAT_DATABASE_URL.");

	validateCombatConfig(config);
	return config;
}

// ==========================================
// Main Entry Point
// ==========================================
int main(int argc, char* argv[])
{
	net::io_context ioc;
	net::steady_timer sweep_timer(ioc);

	try {
		CombatConfig config = load_config(argc, argv);

		// --- Crypto ---
		if (sodium_init() < 0)
			throw std::runtime_error("Libsodium failed to initialize!");
		std::cout << "Libsodium initialized successfully.\n";

		// Outlives the pool so queued turns never roll on a dead generator.
		std::random_device rd;
		std::mt19937 gen(rd());

		// --- Database Initialization ---
		auto db_manager = std::make_shared<DatabaseManager>(config.databaseUrl);
		auto combat_pool = std::make_shared<net::thread_pool>(static_cast<std::size_t>(config.workerThreads));

		// --- Combat Core ---
		auto store = std::make_shared<InMemorySessionStore>();
		auto service = std::make_shared<CombatService>(store, makePgRepositories(db_manager), config, makeRoll(gen));

		// --- Listener ---
		const auto address = net::ip::make_address(config.listenAddress);
		auto listener_ptr = std::make_shared<listener>(
			ioc, tcp::endpoint{ address, config.port }, service, combat_pool);
		listener_ptr->run();

		run_session_sweep_timer(sweep_timer, service, config.sweepIntervalSeconds);
		std::cout << "Combat server is listening on " << config.listenAddress << ":" << config.port << "...\n";
		std::cout << "Type 'exit' or 'shutdown' to stop the server.\n";

		// --- Console Command Thread ---
		std::thread console_thread([&ioc, &sweep_timer, listener_ptr]() {
			std::string command;
			while (std::getline(std::cin, command))
			{
				if (command == "exit" || command == "shutdown")
				{
					std::cout << "\n--- SHUTDOWN INITIATED ---" << std::endl;
					listener_ptr->stop();

					const int grace_period = 10;
					{
						std::lock_guard<std::mutex> lock(g_connection_registry_mutex);
						std::cout << "Broadcasting shutdown warning to "
							<< g_connection_registry.size() << " clients.\n";

						for (auto const& [id, weak_conn] : g_connection_registry)
							if (auto conn = weak_conn.lock())
								conn->send_shutdown_warning(grace_period);
					}

					// Graceful shutdown timer
					auto shutdown_timer = std::make_shared<net::steady_timer>(ioc);
					shutdown_timer->expires_after(std::chrono::seconds(grace_period));

					shutdown_timer->async_wait([&ioc, &sweep_timer, shutdown_timer](const boost::system::error_code& ec)
						{
							if (ec && ec != net::error::operation_aborted)
							{
								std::cerr << "[SHUTDOWN TIMER ERROR] " << ec.message() << std::endl;
								return;
							}

							std::cout << "--- Final disconnect phase ---" << std::endl;
							std::vector<std::shared_ptr<CombatConnection>> connections;
							{
								std::lock_guard<std::mutex> lock(g_connection_registry_mutex);
								for (auto const& [id, weak_conn] : g_connection_registry)
									if (auto c = weak_conn.lock())
										connections.push_back(c);
							}

							for (auto& c : connections) c->disconnect();
							std::cout << "Finalized disconnects for " << connections.size() << " clients.\n";

							sweep_timer.cancel();
							ioc.stop();
						});

					break;
				}
			}
			});

		// --- IO Threads ---
		unsigned const threads = std::max<int>(1, std::thread::hardware_concurrency());
		std::vector<std::thread> io_threads;
		io_threads.reserve(threads - 1);
		for (unsigned i = 1; i < threads; ++i)
			io_threads.emplace_back([&ioc] { ioc.run(); });

		ioc.run(); // main thread

		for (auto& t : io_threads) t.join();
		console_thread.join();

		// Let in-flight turns and settlements finish before the service goes away.
		combat_pool->join();
	}
	catch (const std::exception& e) {
		std::cerr << "FATAL ERROR: " << e.what() << std::endl;
		return 1;
	}

	std::cout << "Server shut down cleanly.\n";
	return 0;
}
