#include "error.hpp"
#include "globals.hpp"
#include "context.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <thread>
#include <ctime>
#include <cstdarg>
#include <cassert>
#include <mutex>

void enforce_impl(bool condition, const char* condition_str, const char* func, const char* file, int line)
{
	if(!condition)
		throwx<EnforceException>(condition_str, func, file, line);
}

bool on_failure_break_into_debugger = false;

void show_error(const std::exception& exception) noexcept
{
	std::string what;

	// put the error message in the log file
	if(const ReelException* reel_ex = dynamic_cast<const ReelException*>(&exception)) {
		what = string_format("%s: %s", reel_ex->class_name(), reel_ex->what());

		for(const ReelException* ex = reel_ex; ex->has_cause(); ex = &ex->cause())
			what += string_format("\n  caused by %s: %s", ex->cause().class_name(), ex->cause().what());
	} else {
		what = string_format("%s", exception.what());
	}

	Log::error("%s", what.c_str());
	std::cerr << what << "\n";
}


/**
 * Stub logger implementation.
 */
class NoLogger : public Logger
{
public:
	virtual void write(const std::string& message) noexcept override {}
};


/**
 * Log to file implementation.
 */
class FileLogger : public Logger
{

public:

	explicit FileLogger(std::filesystem::path path)
	{
		m_stream.rdbuf()->pubsetbuf(nullptr, 0); // make unbuffered
		m_stream.open(path, std::ios_base::out | std::ios_base::app);
		write("Log initialized.");
	}

	virtual void write(const std::string& message) noexcept override
	{
		try {
			// Thread safety: from here on, only one thread at a time can write.
			std::lock_guard<std::mutex> lock{m_mutex};

			// we don't care to check errors as the log is best-effort
			m_stream << message << "\n";
			m_stream.flush();
		}
		catch(const std::exception& ) {
			// We never propagate exceptions out of the Logger as it is already
			// our last-ditch reporting facility.
		}
	}

private:

	std::mutex m_mutex; //!< Only one thread at a time can write
	std::ofstream m_stream;

};

std::unique_ptr<Logger> create_no_log()
{
	return std::make_unique<NoLogger>();
}

std::unique_ptr<Logger> create_file_log(std::filesystem::path path)
{
	return std::make_unique<FileLogger>(path);
}

namespace Log
{

namespace
{

std::pair<std::string, std::string> write_prerequisites() noexcept
{
	// construct date and time string
	const size_t NOW_BUFSIZE = 20;
	std::string now_buffer(NOW_BUFSIZE, '\0');

	const time_t now = std::time(nullptr);
	const struct tm* local_now = std::localtime(&now);

	if(nullptr == local_now) {
		now_buffer = "?-?-? ?:?:?";
	}
	else {
		const size_t strftime_size = strftime(&now_buffer[0], NOW_BUFSIZE, "%Y-%m-%d %H:%M:%S", local_now);

		if(0 >= strftime_size)
			now_buffer = "?-?-? ?:?:?";
		else
			now_buffer.resize(strftime_size);
	}

	// construct thread id string
	std::ostringstream tid_stream;
	tid_stream << std::this_thread::get_id();

	return { std::move(now_buffer), tid_stream.str() };
}

}

void trace(const char *format, ...) noexcept
{
	va_list vlist;
	va_start(vlist, format);
	write("trace", format, vlist);
	va_end(vlist);
}

void info(const char *format, ...) noexcept
{
	va_list vlist;
	va_start(vlist, format);
	write("info", format, vlist);
	va_end(vlist);
}

void error(const char *format, ...) noexcept
{
	va_list vlist;
	va_start(vlist, format);
	write("error", format, vlist);
	va_end(vlist);
}

void write(const char* level, const char *format, va_list vlist) noexcept
{
	if(!the_context.log)
		return;

	try {
		va_list size_list;
		va_copy(size_list, vlist);
		const int size = std::vsnprintf(nullptr, 0, format, size_list) + 1; // Extra space for '\0'
		va_end(size_list);

		if(size <= 0)
			return;

		std::unique_ptr<char[]> buf(new char[size]);
		std::vsnprintf(buf.get(), size, format, vlist);

		const auto [now, tid] = write_prerequisites();
		the_context.log->write(string_format("%s [%s] %s: %s", now.c_str(), tid.c_str(), level, buf.get()));
	}
	catch(const std::exception& ) {
		// Logging is best-effort. A message that cannot be formatted is lost.
	}
}

}


ReelException::ReelException(const ReelException& rhs)
	: m_what(rhs.m_what), m_cause()
{
	if(rhs.m_cause)
		m_cause = rhs.m_cause->clone();
}

ReelException& ReelException::operator=(const ReelException& rhs)
{
	m_what = rhs.m_what;

	if(rhs.m_cause)
		m_cause = rhs.m_cause->clone();

	return *this;
}

std::unique_ptr<ReelException> ReelException::clone() const
{
	return std::make_unique<ReelException>(*this);
}

OutOfRangeException::OutOfRangeException(size_t index, size_t available)
	: ReelExceptionCloning("Battle index %zu out of range (%zu battles available).", index, available),
	m_index(index), m_available(available)
{}

NotFoundException::NotFoundException(std::string matchup, int occurrence)
	: ReelExceptionCloning("No matchup \"%s\" found at occurrence %d.", matchup.c_str(), occurrence),
	m_matchup(std::move(matchup)), m_occurrence(occurrence)
{}

EnforceException::EnforceException(const char* condition, const char* func, const char* file, int line)
	: ReelExceptionCloning("Enforced condition violated in %s (%s:%d), expression: \"%s\"", func, file, line, condition)
{}
