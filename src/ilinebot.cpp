/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2012-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2012-2014 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2007-2008 Robin Burchell <robin+git@viroteck.net>
 *   Copyright (C) 2003-2008 Craig Edwards <brain@inspircd.org>
 *
 * This file is part of IlineBot.  IlineBot is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General Public
 * License as published by the Free Software Foundation, version 2.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include <filesystem>
#include <iostream>

#include <fmt/color.h>
#include <lyra/lyra.hpp>

#include "ilinebot.h"

IlineBot* BotInstance = nullptr;

namespace
{
	std::string ExpandPath(const std::string& path)
	{
		std::error_code ec;
		const auto canonical = std::filesystem::weakly_canonical(path, ec);
		return ec ? path : canonical.string();
	}

	void PrintError(const std::string& message)
	{
		fmt::print("{} {}\nExiting...\n", fmt::styled("Error:", fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red)), message);
	}

	// Parses the command line options.
	void ParseOptions()
	{
		std::string config = BotInstance->Config->Paths.PrependConfig("ilinebot.conf");
		bool do_debug = false;
		bool do_help = false;
		bool do_nofork = false;
		bool do_nolog = false;
		bool do_quiet = false;
		bool do_version = false;

		auto cli = lyra::cli()
			| lyra::opt(config, "FILE")
				["-c"]["--config"]
				("The location of the main config file.")
			| lyra::opt(do_debug)
				["-d"]["--debug"]
				("Start in debug mode.")
			| lyra::opt(do_nofork)
				["-F"]["--nofork"]
				("Stay in the foreground (always the case).")
			| lyra::opt(do_help)
				["-h"]["--help"]
				("Show help and exit.")
			| lyra::opt(do_nolog)
				["-L"]["--nolog"]
				("Disable writing logs to disk.")
			| lyra::opt(do_quiet)
				["-q"]["--quiet"]
				("Do not show the startup banner.")
			| lyra::opt(do_version)
				["-v"]["--version"]
				("Show version and exit.");

		auto result = cli.parse({BotInstance->Config->CommandLine.argc, BotInstance->Config->CommandLine.argv});
		if (!result)
		{
			fmt::print(stderr, "{} {}\n", fmt::styled("Error:", fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red)), result.message());
			BotInstance->Exit(EXIT_FAILURE);
		}

		if (do_help)
		{
			std::cout << cli << std::endl;
			BotInstance->Exit(EXIT_SUCCESS);
		}

		if (do_version)
		{
			fmt::print("{}\n", ILINEBOT_VERSION);
			BotInstance->Exit(EXIT_SUCCESS);
		}

		// Store the relevant parsed arguments
		if (!config.empty())
			BotInstance->ConfigFileName = ExpandPath(config);
		BotInstance->Config->CommandLine.forcedebug = do_debug;
		BotInstance->Config->CommandLine.nofork = do_nofork;
		BotInstance->Config->CommandLine.quiet = do_quiet;
		BotInstance->Config->CommandLine.writelog = !do_nolog;
	}

	// Sets handlers for various process signals.
	void SetSignals()
	{
		signal(SIGALRM, SIG_IGN);
		signal(SIGCHLD, SIG_IGN);
		signal(SIGHUP, IlineBot::SetSignal);
		signal(SIGPIPE, SIG_IGN);
		signal(SIGUSR1, SIG_IGN);
		signal(SIGUSR2, SIG_IGN);
		signal(SIGXFSZ, SIG_IGN);
		signal(SIGTERM, IlineBot::SetSignal);
	}
}

IlineBot::IlineBot(int argc, char** argv)
	: Dispatcher(Links)
{
	BotInstance = this;

	UpdateTime();
	SocketEngine::Init();

	this->Config = std::make_unique<BotConfig>();
	this->Config->CommandLine.argv = argv;
	this->Config->CommandLine.argc = argc;
	ParseOptions();

	if (!Config->CommandLine.quiet)
	{
		fmt::print("{}\n", fmt::styled("IlineBot - " ILINEBOT_SERVICE " I-line lookups for IRC", fmt::emphasis::bold | fmt::fg(fmt::terminal_color::green)));
		fmt::print("{}\n\n", ILINEBOT_VERSION);
	}

	if (Config->CommandLine.forcedebug)
		Logs.EnableDebugMode();
}

IlineBot::~IlineBot()
{
	Cleanup();
}

void IlineBot::Boot()
{
	std::error_code ec;
	if (!std::filesystem::is_regular_file(ConfigFileName, ec))
	{
		Logs.Critical("STARTUP", "Unable to open config file {}", ConfigFileName);
		PrintError("Cannot open config file: " + ConfigFileName);
		Exit(EXIT_FAILURE);
	}

	SetSignals();

	if (!Config->CommandLine.quiet)
		fmt::print("IlineBot Process ID: {}\n", fmt::styled(getpid(), fmt::emphasis::bold | fmt::fg(fmt::terminal_color::green)));

	this->Config->Read(ConfigFileName);
	if (!this->Config->Apply(nullptr))
	{
		PrintError("Unable to load " + ConfigFileName);
		Exit(EXIT_FAILURE);
	}

	try
	{
		Logs.CloseLogs();
		Logs.OpenLogs();
	}
	catch (const CoreException& ex)
	{
		PrintError("Cannot open log files: " + ex.GetReason());
		Exit(EXIT_FAILURE);
	}

	ApplyLinks();

	fflush(stdout);
	fflush(stderr);

	Logs.Normal("STARTUP", "Startup complete with {} network(s) configured", Networks.size());
}

void IlineBot::ApplyLinks()
{
	std::vector<std::unique_ptr<IRCLink>> links;
	for (const auto& [_, tag] : Config->ConfTags("link"))
	{
		const std::string name = tag->getString("name");
		auto existing = std::find_if(Networks.begin(), Networks.end(), [&name](const auto& link) {
			return irc::equals(link->GetTag(), name);
		});

		if (existing != Networks.end())
		{
			(*existing)->Configure(tag);
			(*existing)->JoinChannels();
			links.push_back(std::move(*existing));
			Networks.erase(existing);
			continue;
		}

		try
		{
			auto link = std::make_unique<IRCLink>(tag);
			link->Connect();
			links.push_back(std::move(link));
		}
		catch (const CoreException& ex)
		{
			Logs.Critical("LINK", "Unable to create the {} link: {}", name, ex.GetReason());
		}
	}

	for (const auto& link : Networks)
	{
		Logs.Normal("LINK", "The {} link is no longer configured, disconnecting", link->GetTag());
		link->Quit("Link removed from configuration");
	}
	Networks = std::move(links);
}

void IlineBot::Rehash()
{
	Logs.Normal("CONFIG", "Reloading configuration from {}", ConfigFileName);

	auto newconfig = std::make_unique<BotConfig>();
	newconfig->Read(ConfigFileName);
	if (!newconfig->Apply(Config.get()))
	{
		Logs.Warning("CONFIG", "The new configuration is not valid; the old configuration is still in use");
		return;
	}

	// Requests which are in progress keep the settings they were accepted with.
	std::swap(Config, newconfig);

	try
	{
		Logs.CloseLogs();
		Logs.OpenLogs();
	}
	catch (const CoreException& ex)
	{
		Logs.Critical("CONFIG", "Cannot open log files: {}", ex.GetReason());
	}

	ApplyLinks();
	Logs.Normal("CONFIG", "New configuration has been applied");
}

void IlineBot::Cleanup()
{
	for (const auto& link : Networks)
		link->Quit("Shutting down");
	Networks.clear();

	SocketEngine::Deinit();
	Logs.CloseLogs();
}

void IlineBot::Exit(int status)
{
	delete this;
	BotInstance = nullptr;
	exit(status);
}

void IlineBot::HandleSignal(sig_atomic_t signal)
{
	switch (signal)
	{
		case SIGHUP:
			Logs.Normal("SIGNAL", "Received SIGHUP, reloading configuration");
			Rehash();
			break;

		case SIGTERM:
			Logs.Normal("SIGNAL", "Received SIGTERM, exiting");
			Exit(EXIT_SUCCESS);

		default:
			Logs.Debug("SIGNAL", "Ignoring unhandled signal {}", static_cast<int>(signal));
			break;
	}
}

void IlineBot::UpdateTime()
{
	clock_gettime(CLOCK_REALTIME, &ts);
}

void IlineBot::Run()
{
	UpdateTime();
	auto oldtime = Time();

	while (true)
	{
		UpdateTime();

		if (Time() != oldtime)
		{
			oldtime = Time();
			Timers.TickTimers();
		}

		// Both the IRC connections and the lookup worker pipes are in the socket engine.
		SocketEngine::DispatchTrialWrites();
		SocketEngine::DispatchEvents();

		if (lastsignal)
		{
			HandleSignal(lastsignal);
			lastsignal = 0;
		}
	}
}

sig_atomic_t IlineBot::lastsignal = 0;

void IlineBot::SetSignal(int signal)
{
	lastsignal = signal;
}
