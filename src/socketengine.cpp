/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2014-2015 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2014, 2017 Adam <Adam@anope.org>
 *   Copyright (C) 2013, 2016-2017, 2022-2023 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2009-2010 Daniel De Graaf <danieldg@inspircd.org>
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

#include <fcntl.h>
#include <poll.h>

#include "ilinebot.h"

namespace
{
	/** The file descriptors which are passed to poll(). */
	std::vector<pollfd> pollfds;

	/** The handler for each entry in pollfds. */
	std::vector<EventHandler*> handlers;

	/** Maps a file descriptor to its index in pollfds. */
	std::map<int, size_t> indices;

	/** The file descriptors which want a trial read or write. */
	std::set<int> trials;

	short MaskToPoll(int event_mask)
	{
		short events = 0;
		if (event_mask & FD_WANT_FAST_READ)
			events |= POLLIN;
		if (event_mask & (FD_WANT_FAST_WRITE | FD_WANT_SINGLE_WRITE))
			events |= POLLOUT;
		return events;
	}
}

void SocketEngine::Init()
{
	pollfds.reserve(16);
	handlers.reserve(16);
}

void SocketEngine::Deinit()
{
	pollfds.clear();
	handlers.clear();
	indices.clear();
	trials.clear();
}

bool SocketEngine::AddFd(EventHandler* eh, int event_mask)
{
	if (!eh->HasFd())
	{
		BotInstance->Logs.Debug("SOCKET", "Attempt to add a handler without a file descriptor");
		return false;
	}

	const int fd = eh->GetFd();
	if (indices.count(fd))
	{
		BotInstance->Logs.Debug("SOCKET", "Attempt to add duplicate fd: {}", fd);
		return false;
	}

	indices[fd] = pollfds.size();
	pollfds.push_back({ fd, MaskToPoll(event_mask), 0 });
	handlers.push_back(eh);
	eh->event_mask = event_mask;

	BotInstance->Logs.Debug("SOCKET", "New file descriptor: {} (index {})", fd, indices[fd]);
	return true;
}

void SocketEngine::ChangeEventMask(EventHandler* eh, int change)
{
	const int old_mask = eh->event_mask;
	int new_mask = old_mask;

	if (change & FD_WANT_READ_MASK)
		new_mask &= ~FD_WANT_READ_MASK;
	if (change & FD_WANT_WRITE_MASK)
		new_mask &= ~FD_WANT_WRITE_MASK;

	if ((change & FD_TRIAL_NOTE_MASK) && !(old_mask & FD_TRIAL_NOTE_MASK))
		trials.insert(eh->GetFd());

	new_mask |= change;
	if (new_mask == old_mask)
		return;

	eh->event_mask = new_mask;
	OnSetEvent(eh, new_mask);
}

void SocketEngine::OnSetEvent(EventHandler* eh, int new_mask)
{
	auto it = indices.find(eh->GetFd());
	if (it == indices.end())
		return;

	pollfds[it->second].events = MaskToPoll(new_mask);
}

void SocketEngine::DelFd(EventHandler* eh)
{
	auto it = indices.find(eh->GetFd());
	if (it == indices.end() || handlers[it->second] != eh)
	{
		BotInstance->Logs.Debug("SOCKET", "DelFd() on unknown fd: {}", eh->GetFd());
		return;
	}

	// Fill the gap with the last entry so that pollfds stays contiguous.
	const size_t index = it->second;
	const size_t last = pollfds.size() - 1;
	if (index != last)
	{
		pollfds[index] = pollfds[last];
		handlers[index] = handlers[last];
		indices[pollfds[index].fd] = index;
	}

	pollfds.pop_back();
	handlers.pop_back();
	indices.erase(it);
	trials.erase(eh->GetFd());

	BotInstance->Logs.Debug("SOCKET", "Remove file descriptor: {} (index {})", eh->GetFd(), index);
}

EventHandler* SocketEngine::GetRef(int fd)
{
	auto it = indices.find(fd);
	return it == indices.end() ? nullptr : handlers[it->second];
}

int SocketEngine::DispatchEvents(int timeout)
{
	const int ready = poll(pollfds.data(), static_cast<nfds_t>(pollfds.size()), timeout);
	BotInstance->UpdateTime();
	if (ready <= 0)
		return ready;

	// Handlers may add or remove file descriptors so work from a copy.
	std::vector<std::pair<int, short>> fired;
	for (const auto& pfd : pollfds)
	{
		if (pfd.revents)
			fired.emplace_back(pfd.fd, pfd.revents);
	}

	for (const auto& [fd, revents] : fired)
	{
		EventHandler* eh = GetRef(fd);
		if (!eh)
			continue;

		if (revents & POLLERR)
		{
			int errcode;
			socklen_t codesize = sizeof(errcode);
			if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &errcode, &codesize) < 0)
				errcode = errno;
			eh->OnEventHandlerError(errcode);
			continue;
		}

		if (revents & POLLHUP)
		{
			eh->OnEventHandlerError(0);
			continue;
		}

		if (revents & POLLIN)
		{
			eh->event_mask &= ~FD_READ_WILL_BLOCK;
			eh->OnEventHandlerRead();
			if (GetRef(fd) != eh)
				continue;
		}

		if (revents & POLLOUT)
		{
			eh->event_mask &= ~(FD_WRITE_WILL_BLOCK | FD_WANT_SINGLE_WRITE);
			OnSetEvent(eh, eh->event_mask);
			eh->OnEventHandlerWrite();
		}
	}
	return static_cast<int>(fired.size());
}

void SocketEngine::DispatchTrialWrites()
{
	const std::vector<int> pending(trials.begin(), trials.end());
	trials.clear();
	for (const int fd : pending)
	{
		EventHandler* eh = GetRef(fd);
		if (!eh)
			continue;

		const int mask = eh->event_mask;
		eh->event_mask &= ~FD_TRIAL_NOTE_MASK;
		if ((mask & (FD_ADD_TRIAL_READ | FD_READ_WILL_BLOCK)) == FD_ADD_TRIAL_READ)
		{
			eh->OnEventHandlerRead();
			if (GetRef(fd) != eh)
				continue;
		}

		if ((mask & (FD_ADD_TRIAL_WRITE | FD_WRITE_WILL_BLOCK)) == FD_ADD_TRIAL_WRITE)
			eh->OnEventHandlerWrite();
	}
}

int SocketEngine::Close(EventHandler* eh)
{
	DelFd(eh);
	const int ret = Close(eh->GetFd());
	eh->SetFd(-1);
	return ret;
}

int SocketEngine::Close(int fd)
{
	return close(fd);
}

int SocketEngine::NonBlocking(int fd)
{
	const int flags = fcntl(fd, F_GETFL, 0);
	return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}
