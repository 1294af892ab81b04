#include "Logging.hpp"
#include "consoleUi.hpp"
#include "options.hpp"

#include "core/errors.hpp"
#include "core/eventBus.hpp"
#include "core/turnEngine.hpp"
#include "gameNet/networkPlayer.hpp"
#include "network/tcpClient.hpp"
#include "network/tcpServer.hpp"
#include "player/aiPlayer.hpp"
#include "player/localPlayer.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

using namespace ttt;

static std::optional<std::chrono::milliseconds> toTimeout(const app::Options& options) {
	if (!options.timeout) {
		return std::nullopt;
	}
	return std::chrono::duration_cast<std::chrono::milliseconds>(*options.timeout);
}

static std::unique_ptr<IPlayer> makeAi(EventBus& bus, const Symbol symbol, const app::PlayerKind kind) {
	return std::make_unique<AiPlayer>(bus, symbol, kind == app::PlayerKind::EasyAi ? AiLevel::Easy : AiLevel::Hard);
}

//! Participant playing at this machine.
static std::unique_ptr<IPlayer> makeParticipant(EventBus& bus, app::ConsoleUi& ui, const Symbol symbol, const app::PlayerKind kind) {
	if (kind == app::PlayerKind::Human) {
		ui.addHumanSymbol(symbol);
		return std::make_unique<LocalPlayer>(bus, symbol);
	}
	return makeAi(bus, symbol, kind);
}

static int exitCode(const app::SessionEnd end) {
	switch (end) {
	case app::SessionEnd::Finished:
	case app::SessionEnd::Quit:
	case app::SessionEnd::InputClosed:
		return 0;
	case app::SessionEnd::ConnectionLost:
	case app::SessionEnd::Failed:
		return 1;
	}
	return 1;
}

//! Failures of asynchronously delivered events end the session.
static void reportAsyncErrors(EventBus& bus, app::ConsoleUi& ui) {
	bus.setAsyncErrorHandler([&ui](const std::exception& ex) { ui.abort(ex.what()); });
}

static int runLocal(const app::Options& options) {
	EventBus bus;
	TurnEngine engine(bus);
	app::ConsoleUi ui(bus, std::cin, std::cout);
	reportAsyncErrors(bus, ui);

	const auto playerX = makeParticipant(bus, ui, Symbol::X, options.playerX);
	const auto playerO = makeParticipant(bus, ui, Symbol::O, options.playerO);

	engine.start();
	const auto end = ui.run();

	bus.shutdown();
	return exitCode(end);
}

static int runHost(const app::Options& options) {
	network::TcpServer server(options.port);
	std::cout << std::format("Waiting for a player on port {}...", server.port()) << std::endl;
	auto channel = server.accept(toTimeout(options));

	std::random_device device;
	const Symbol hostSymbol = std::bernoulli_distribution(0.5)(device) ? Symbol::X : Symbol::O;

	EventBus bus;
	TurnEngine engine(bus);
	app::ConsoleUi ui(bus, std::cin, std::cout);
	reportAsyncErrors(bus, ui);

	gameNet::RemoteNetworkPlayer remote(bus, std::move(channel), opponent(hostSymbol));
	const auto local = makeParticipant(bus, ui, hostSymbol, options.player);
	ui.print(std::format("You play {}.", toString(hostSymbol)));

	engine.start();
	const auto end = ui.run();

	bus.shutdown();
	return exitCode(end);
}

static int runClient(const app::Options& options) {
	auto channel = network::connectToServer(options.host, options.port, toTimeout(options));

	EventBus bus;
	TurnEngine engine(bus, EngineMode::Mirror);
	app::ConsoleUi ui(bus, std::cin, std::cout);
	reportAsyncErrors(bus, ui);

	gameNet::LocalNetworkPlayer relay(bus, std::move(channel));
	std::unique_ptr<IPlayer> ai;
	if (options.player == app::PlayerKind::Human) {
		ui.addHumanSymbol(relay.symbol());
	} else {
		ai = makeAi(bus, relay.symbol(), options.player);
	}
	ui.print(std::format("You play {}.", toString(relay.symbol())));

	relay.start();
	const auto end = ui.run();

	bus.shutdown();
	return exitCode(end);
}

int main(int argc, char** argv) {
	const std::string_view program = argc > 0 ? argv[0] : "tictactoe";

	std::vector<std::string_view> args;
	for (int i = 1; i < argc; ++i) {
		args.emplace_back(argv[i]);
	}

	app::Options options;
	try {
		options = app::parseOptions(args);
	} catch (const app::OptionsError& ex) {
		std::cerr << ex.what() << "\n\n" << app::usage(program);
		return 2;
	}

	if (options.showHelp) {
		std::cout << app::usage(program);
		return 0;
	}

	try {
		if (options.mode == app::Mode::Local) {
			return runLocal(options);
		}
		return options.role == app::Role::Host ? runHost(options) : runClient(options);
	} catch (const NetworkError& ex) {
		app::Logger().Log(Logging::LogLevel::Error, std::format("[App] Network failure: {}", ex.what()));
		std::cerr << std::format("Network error: {}\n", ex.what());
		return 1;
	} catch (const GameError& ex) {
		app::Logger().Log(Logging::LogLevel::Error, std::format("[App] {}", ex.what()));
		std::cerr << std::format("Error: {}\n", ex.what());
		return 1;
	}
}
