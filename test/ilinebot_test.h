/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2016 Adam <Adam@anope.org>
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


#pragma once

#include "ilinebot.h"
#include <gtest/gtest.h>

namespace ilinetest
{
	/** Creates settings for the TestNet/#iline channel with the given overrides. */
	inline std::shared_ptr<const LookupSettings> MakeSettings(std::initializer_list<std::pair<const char*, const char*>> items = {})
	{
		auto tag = std::make_shared<ConfigTag>("iline", FilePosition("<test>", 0, 0));
		tag->GetItems()["channels"] = "TestNet/#iline";
		for (const auto& [key, value] : items)
			tag->GetItems()[key] = value;
		return std::make_shared<LookupSettings>(tag);
	}

	class Test : public testing::Test
	{
	protected:
		IlineBot* ilinebot;

		void SetUp() override
		{
			const char* argv[] = { "ilinebot", "--nofork", "--quiet", nullptr };
			ilinebot = new IlineBot(3, const_cast<char**>(argv));
		}

		void TearDown() override
		{
			delete ilinebot;
			BotInstance = nullptr;
		}

		/** Runs the event loop until the lookup in progress has finished. */
		void WaitForLookup()
		{
			for (int i = 0; i < 100 && BotInstance->Dispatcher.GetSlot().IsBusy(); ++i)
			{
				SocketEngine::DispatchEvents(100);
				BotInstance->Timers.TickTimers();
			}
		}
	};

	/** A message which was sent to a channel through a FakeTransport. */
	struct SentMessage final
	{
		std::string channel;
		std::string text;
	};

	/** An in-memory network which records everything that is sent to it. */
	class FakeTransport final
		: public Transport
	{
	public:
		typedef std::map<std::string, MemberInfo, irc::insensitive_swo> MemberMap;

		std::string tag;
		std::string nick = "IlineBot";
		unsigned long lag = 0;
		std::map<std::string, MemberMap, irc::insensitive_swo> channels;
		std::set<std::string, irc::insensitive_swo> synced;
		std::vector<SentMessage> sent;
		std::vector<std::pair<char, std::string>> stats;

		FakeTransport(const std::string& Tag = "TestNet")
			: tag(Tag)
		{
			BotInstance->Links.Add(this);
		}

		~FakeTransport() override
		{
			if (BotInstance)
				BotInstance->Links.Del(this);
		}

		/** Joins a channel as an operator and optionally marks it synced. */
		void Join(const std::string& channel, bool sync = true)
		{
			MemberInfo& self = AddMember(channel, nick, "iline", "bot.example.com");
			self.op = true;
			if (sync)
				synced.insert(channel);
		}

		MemberInfo& AddMember(const std::string& channel, const std::string& member, const std::string& user, const std::string& host)
		{
			MemberInfo& info = channels[channel][member];
			info.nick = member;
			info.user = user;
			info.host = host;
			return info;
		}

		/** Retrieves the text of everything sent so far. */
		std::vector<std::string> Texts() const
		{
			std::vector<std::string> texts;
			for (const auto& message : sent)
				texts.push_back(message.text);
			return texts;
		}

		const std::string& GetTag() const override { return tag; }
		const std::string& GetNick() const override { return nick; }
		unsigned long GetLag() const override { return lag; }
		bool IsSynced(const std::string& channel) const override { return IsJoined(channel) && synced.count(channel); }
		bool IsJoined(const std::string& channel) const override { return channels.count(channel); }

		std::optional<MemberInfo> FindMember(const std::string& channel, const std::string& member) const override
		{
			auto chan = channels.find(channel);
			if (chan == channels.end())
				return std::nullopt;

			auto it = chan->second.find(member);
			if (it == chan->second.end())
				return std::nullopt;
			return it->second;
		}

		void SendChannel(const std::string& channel, const std::string& text) override
		{
			sent.push_back({ channel, text });
		}

		void SendStatsQuery(char type, const std::string& target) override
		{
			stats.emplace_back(type, target);
		}
	};
}
