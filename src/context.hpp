/**
 * Containers for configurable dependencies.
 */
#pragma once

#include <memory>

class Configuration;
class Logger;

/**
 * Contains general-purpose objects that should be available everywhere.
 */
struct GlobalContext
{
	~GlobalContext();

	std::unique_ptr<Configuration> configuration; //!< application-wide configuration
	std::unique_ptr<Logger> log; //!< logger
};

/**
 * The generally available context object.
 * All code except the main function may assume that all
 * contained interfaces point to implementations.
 */
extern GlobalContext the_context;
