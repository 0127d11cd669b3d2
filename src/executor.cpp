/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
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

#include <regex>
#include <curl/curl.h>

#include "ilinebot.h"

namespace
{
	size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userdata)
	{
		auto* body = static_cast<std::string*>(userdata);
		body->append(data, size * nmemb);
		return size * nmemb;
	}

	bool IsSafeChar(unsigned char chr)
	{
		return chr && (isalnum(chr) || strchr(".:_-<>,(/) ", chr));
	}

	// Writes the whole of a buffer to a pipe from the child process.
	void WriteAll(int fd, const std::string& data)
	{
		size_t written = 0;
		while (written < data.length())
		{
			ssize_t ret = write(fd, data.data() + written, data.length() - written);
			if (ret < 0 && errno == EINTR)
				continue;
			if (ret <= 0)
				return;
			written += ret;
		}
	}
}

LookupExecutor::LookupExecutor(RequestSlot& Slot, LinkManager& Links)
	: slot(Slot)
	, links(Links)
	, Fetch(FetchURL)
{
	curl_global_init(CURL_GLOBAL_DEFAULT);
}

LookupExecutor::~LookupExecutor()
{
	pipe.reset();
	curl_global_cleanup();
}

std::string LookupExecutor::FetchURL(const std::string& url, unsigned long timeout)
{
	std::string body;
	CURL* curl = curl_easy_init();
	if (!curl)
		return body;

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_USERAGENT, ILINEBOT_VERSION);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

	if (curl_easy_perform(curl) != CURLE_OK)
		body.clear();

	curl_easy_cleanup(curl);
	return body;
}

bool LookupExecutor::IsRunning() const
{
	return pipe && !pipe->IsFinished();
}

void LookupExecutor::Execute(const std::string& address)
{
	const LookupRequest* request = slot.Get();
	if (!request)
		return;

	const std::string url = request->settings->URL + address;
	const unsigned long timeout = request->settings->FetchTimeout;

	int fds[2];
	if (::pipe(fds) < 0)
	{
		BotInstance->Logs.Warning("EXECUTOR", "Unable to create a pipe for {}: {}", url, strerror(errno));
		slot.Release();
		return;
	}

	pid_t pid = fork();
	if (pid < 0)
	{
		BotInstance->Logs.Warning("EXECUTOR", "Unable to fork a child for {}: {}", url, strerror(errno));
		SocketEngine::Close(fds[0]);
		SocketEngine::Close(fds[1]);
		slot.Release();
		return;
	}

	if (pid == 0)
	{
		// Child process. Nothing from the parent may be flushed or destroyed here.
		close(fds[0]);
		WriteAll(fds[1], Fetch(url, timeout));
		close(fds[1]);
		_exit(EXIT_SUCCESS);
	}

	SocketEngine::Close(fds[1]);
	SocketEngine::NonBlocking(fds[0]);

	pipe = std::make_unique<LookupPipe>(*this, fds[0]);
	if (!SocketEngine::AddFd(pipe.get(), FD_WANT_FAST_READ | FD_WANT_NO_WRITE))
	{
		BotInstance->Logs.Warning("EXECUTOR", "Unable to watch the pipe for {}", url);
		pipe.reset();
		slot.Release();
		return;
	}

	BotInstance->Logs.Debug("EXECUTOR", "Fetching {} in child process {} (fd {})", url, pid, fds[0]);
}

std::string LookupExecutor::Clean(const std::vector<std::string>& lines, unsigned int& flags)
{
	static const std::regex tagregex("</?[a-z]+?>", std::regex::ECMAScript | std::regex::icase | std::regex::optimize);

	std::vector<std::string> trimmed;
	for (const auto& line : lines)
	{
		if (trimmed.size() >= MaxLines)
			break;
		trimmed.push_back(iline::trim(line));
	}

	std::string text = iline::trim(iline::join(trimmed));
	if (text.empty())
		return text;

	text = iline::trim(std::regex_replace(text, tagregex, ""));
	if (text.length() > MaxLength)
	{
		text = iline::trim(text.substr(0, MaxLength));
		flags |= RF_TRUNCATED;
	}

	if (!std::all_of(text.begin(), text.end(), IsSafeChar))
	{
		text.erase(std::remove_if(text.begin(), text.end(), [](unsigned char chr) { return !IsSafeChar(chr); }), text.end());
		text = iline::trim(text);
		flags |= RF_GARBAGE;
	}
	return text;
}

void LookupExecutor::OnResult(const std::vector<std::string>& lines)
{
	const LookupRequest* request = slot.Get();
	if (!request)
		return;

	const LookupSettings& settings = *request->settings;
	Transport* link = links.Find(request->network);
	if (!link || !link->IsJoined(request->channel))
	{
		BotInstance->Logs.Debug("EXECUTOR", "Dropping the reply for {} as {}/{} is gone",
			request->nick, request->network, request->channel);
		slot.Release();
		return;
	}

	unsigned int flags = RF_REPLY;
	std::string text = Clean(lines, flags);
	if (text.empty())
	{
		text = "No reply";
		if (settings.ShowExtended)
			text.append(" (").append(settings.URL).append(")");
		flags = RF_REPLY | RF_ERROR;
	}

	Reply::Send(settings, *link, request->channel, request->nick, flags, text);
	slot.Release();
}

LookupPipe::LookupPipe(LookupExecutor& Executor, int newfd)
	: executor(Executor)
{
	SetFd(newfd);
}

LookupPipe::~LookupPipe()
{
	if (HasFd())
		SocketEngine::Close(this);
}

bool LookupPipe::Drain()
{
	char data[1024];
	while (true)
	{
		ssize_t ret = read(GetFd(), data, sizeof(data));
		if (ret > 0)
		{
			buffer.append(data, ret);
			continue;
		}

		if (ret == 0)
			return true;

		if (errno == EINTR)
			continue;

		if (SocketEngine::IgnoreError())
			return false;

		BotInstance->Logs.Debug("EXECUTOR", "Unable to read from fd {}: {}", GetFd(), strerror(errno));
		return true;
	}
}

void LookupPipe::Finish()
{
	if (finished)
		return;

	finished = true;
	SocketEngine::Close(this);

	std::vector<std::string> lines;
	// Blank lines count towards the limit.
	irc::sepstream linestream(buffer, '\n', true);
	for (std::string line; lines.size() < LookupExecutor::MaxLines && linestream.GetToken(line); )
		lines.push_back(line);

	BotInstance->Logs.Debug("EXECUTOR", "Read {} bytes ({} lines) from the lookup child", buffer.length(), lines.size());
	executor.OnResult(lines);
}

void LookupPipe::OnEventHandlerRead()
{
	const bool closed = Drain();
	if (closed || std::count(buffer.begin(), buffer.end(), '\n') >= static_cast<std::ptrdiff_t>(LookupExecutor::MaxLines))
		Finish();
}

void LookupPipe::OnEventHandlerError(int errornum)
{
	// A hangup can arrive with unread data still in the pipe.
	Drain();
	Finish();
}
