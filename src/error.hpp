/**
 * Error handling and logging facilities.
 *
 * Our error-handling strategy consists of three approaches.
 *
 * 1. We use the standard assert macro for never-happens conditions.
 *    In cases such as the default branch of an enum switch-statement or
 *    for safety checks within a module, we use this shortest standard check.
 *
 * 2. We use our own enforce macro for validating values that ostensibly
 *    originate within the program, such as input parameters from other
 *    modules. It throws a generic EnforceException.
 *
 * 3. We use our custom exception hierarchy for errors that might conceivably
 *    reach the user. This includes bad configuration, unreadable input files
 *    and battle selections that do not exist in the input.
 *
 * Malformed battle logs are not errors. The parser degrades silently:
 * unterminated blocks and unrecognized lines are dropped.
 *
 * The custom exceptions come with a short error message that
 * describes the problem.
 */
#pragma once

#include <exception>
#include <memory>
#include <string>
#include <cstdarg>
#include <filesystem>
#include "globals.hpp"

/**
 * Evaluate the condition and throw an @c EnforceException if it is false.
 * Intended for use through the @c enforce macro.
 */
void enforce_impl(bool condition, const char* condition_str, const char* func, const char* file, int line);

// expression-to-string helper
#define STR1(x) #x
#define BR_STRINGIZE(x) STR1(x)

// align compilers
#if defined(__GNUC__) || defined(__MINGW32__)
#define BR_FUNC __PRETTY_FUNCTION__
#elif _MSC_VER
#define BR_FUNC __FUNCSIG__
#else
#define BR_FUNC __func__
#endif

/**
 * In our debug-build implementation, if a safety check fails (input contracts,
 * library return values etc), we stop the application so that the debugger may
 * inspect the state before the call stack unwinds.
 * This can interfere with unit tests. Before executing unit tests, this flag
 * must therefore be set to false.
 */
extern bool on_failure_break_into_debugger;

// prepare forward declarations for throwx, but avoid pulling in the huge windows.h
#if defined(_WIN32)
extern "C" __declspec(dllimport) void __stdcall DebugBreak();
#else
#include <csignal>
#endif

/**
 * Construct the specified exception with the given parameters and throw it.
 *
 * Before the exception is thrown, this function attempts to break into the
 * debugger, if available.
 */
template<class Except, class... Args>
[[noreturn]]
void throwx(Args&& ... params)
{
	if(on_failure_break_into_debugger) {
		// Stop and activate the debugger.
		// https://stackoverflow.com/questions/4326414/set-breakpoint-in-c-or-c-code-programmatically-for-gdb-on-linux
		// https://docs.microsoft.com/en-us/visualstudio/debugger/debugbreak-and-debugbreak
#if defined(_WIN32)
		DebugBreak();
#else
		std::raise(SIGABRT);  /* To continue from here in GDB: "signal 0". */
#endif
	}

	throw Except(std::forward<Args>(params)...);
}

/**
 * Evaluate the condition and throw an @c EnforceException if it is false.
 */
#define enforce(CONDITION) enforce_impl(bool(CONDITION), BR_STRINGIZE(CONDITION), BR_FUNC, __FILE__, __LINE__)

/**
 * Report the error to the user in an appropriate way.
 * For a command-line tool, this means a line on standard error.
 * In any case, write an error log entry.
 */
void show_error(const std::exception& exception) noexcept;

// ================================================
// Logging
// ================================================

/**
 * Interface for the underlying logging implementation.
 * All implementations should be thread-safe.
 */
class Logger
{

public:

	virtual ~Logger() =default;
	virtual void write(const std::string& message) noexcept =0;

};

/**
 * Create a logging implementation that swallows all messages.
 */
std::unique_ptr<Logger> create_no_log();

/**
 * Create a logging implementation that writes to the specified file.
 */
std::unique_ptr<Logger> create_file_log(std::filesystem::path path);

/**
 * Logging convenience functions.
 * Format messages on different log levels and hands them to a the logging
 * implementation defined in the global context, e.g. to be written to a file.
 */
namespace Log
{

/**
 * Write a trace-level log message.
 * If the logger is not intialized, do nothing.
 */
void trace(const char *format, ...) noexcept;

/**
 * Write an info-level log message.
 * If the logger is not intialized, do nothing.
 */
void info(const char *format, ...) noexcept;

/**
 * Write an error-level log message.
 * If the logger is not intialized, do nothing.
 */
void error(const char *format, ...) noexcept;

/**
 * Format the given message and write it using the implementation.
 */
void write(const char* level, const char *format, va_list vlist) noexcept;

}

// ================================================
// Exception class hierarchy
// ================================================

/**
 * General exception for all types of errors that occur in the application.
 */
class ReelException : public std::exception
{

public:

	/**
	 * Constructor from a root cause exception and a printf-style formatted message.
	 */
	template<typename... Args>
	explicit ReelException(ReelException cause, const std::string& format, Args&& ... args)
		: m_what(string_format(format, std::forward<Args>(args)...)),
		m_cause(std::make_unique<ReelException>(std::move(cause)))
	{
	}

	/**
	 * Constructor from a printf-style formatted message.
	 */
	template<typename... Args>
	explicit ReelException(const std::string& format, Args&& ... args)
		: m_what(string_format(format, std::forward<Args>(args)...))
	{
	}

	ReelException(const ReelException& rhs);
	ReelException(ReelException&& rhs) noexcept = default;
	ReelException& operator=(const ReelException& rhs);
	ReelException& operator=(ReelException&& rhs) noexcept = default;
	virtual ~ReelException() noexcept = default;

	virtual std::unique_ptr<ReelException> clone() const;
	virtual const char* class_name() const noexcept { return "ReelException"; }
	virtual const char* what() const noexcept final override { return m_what.c_str(); }
	bool has_cause() const noexcept { return bool(m_cause); }
	const ReelException& cause() const noexcept { return *m_cause; }

private:

	std::string m_what;
	std::unique_ptr<ReelException> m_cause;

};

// shortcut helpers for declaring derived exception classes
#define EXCEPTION_CONSTRUCT(Class, Base) \
	template<typename... Args> \
	explicit Class(ReelException cause, const std::string& format, Args&& ... args) \
		: Base(std::move(cause), format, std::forward<Args>(args)...) \
	{} \
	template<typename... Args> \
	explicit Class(const std::string& format, Args&& ... args) \
		: Base(format, std::forward<Args>(args)...) \
	{}

#define EXCEPTION_DEFAULT(Class) \
	Class(const Class& rhs) = default; \
	Class(Class&& rhs) noexcept = default; \
	Class& operator=(const Class& rhs) = default; \
	Class& operator=(Class&& rhs) noexcept = default; \
	virtual ~Class() noexcept = default; \
	virtual const char* class_name() const noexcept override { return #Class; }

/**
 * Base exception class that implements cloning through the CRTP.
 *
 * This class cannot be instantiated on its own. A derived implementation is required.
 */
template<class ExceptionImpl>
class ReelExceptionCloning : public ReelException
{

public:

	virtual std::unique_ptr<ReelException> clone() const override
	{
		return std::make_unique<ExceptionImpl>(static_cast<const ExceptionImpl&>(*this));
	}

protected:

	EXCEPTION_CONSTRUCT(ReelExceptionCloning, ReelException)
	EXCEPTION_DEFAULT(ReelExceptionCloning)

};

/**
 * Invalid syntax or values encountered while reading configuration.
 */
class ConfigException : public ReelExceptionCloning<ConfigException>
{

public:

	EXCEPTION_CONSTRUCT(ConfigException, ReelExceptionCloning)
	EXCEPTION_DEFAULT(ConfigException)

};

/**
 * The battle log could not be opened or read.
 */
class InputException : public ReelExceptionCloning<InputException>
{

public:

	EXCEPTION_CONSTRUCT(InputException, ReelExceptionCloning)
	EXCEPTION_DEFAULT(InputException)

};

/**
 * A battle was selected by an index beyond the number of battles in the log.
 */
class OutOfRangeException : public ReelExceptionCloning<OutOfRangeException>
{

public:

	/**
	 * Constructor from the attempted index and the number of battles in the log.
	 */
	explicit OutOfRangeException(size_t index, size_t available);

	size_t index() const noexcept { return m_index; }
	size_t available() const noexcept { return m_available; }

	EXCEPTION_DEFAULT(OutOfRangeException)

private:

	size_t m_index;
	size_t m_available;

};

/**
 * A battle was selected by matchup, but the log does not contain
 * enough battles with that header.
 */
class NotFoundException : public ReelExceptionCloning<NotFoundException>
{

public:

	/**
	 * Constructor from the requested matchup and 0-based occurrence.
	 */
	explicit NotFoundException(std::string matchup, int occurrence);

	const std::string& matchup() const noexcept { return m_matchup; }
	int occurrence() const noexcept { return m_occurrence; }

	EXCEPTION_DEFAULT(NotFoundException)

private:

	std::string m_matchup;
	int m_occurrence;

};

/**
 * The value of a "t:" protocol line is not an epoch time.
 * The record builder recovers from this by using the current time.
 */
class TimestampException : public ReelExceptionCloning<TimestampException>
{

public:

	EXCEPTION_CONSTRUCT(TimestampException, ReelExceptionCloning)
	EXCEPTION_DEFAULT(TimestampException)

};

/**
 * Exception for violated input expectations and contracts.
 */
class EnforceException : public ReelExceptionCloning<EnforceException>
{

public:

	explicit EnforceException(const char* condition, const char* func, const char* file, int line);

	EXCEPTION_DEFAULT(EnforceException)

};
