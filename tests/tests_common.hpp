/**
 * tests_common.hpp
 * Definitions for shared helpers for unit tests.
 */
#pragma once

#include "battle.hpp"
#include <string>
#include <vector>
#include <filesystem>

#pragma warning(push)
#pragma warning(disable : 26451)
#pragma warning(disable : 26495)
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#pragma warning(pop)

/**
 * Set the global context to use stub implementations for our test environment.
 */
void configure_context_for_testing();

/**
 * Read all battles from the source.
 */
std::vector<BattleBlock> read_all(const IBattleSource& source);

/**
 * Read all battles from the battle log text.
 */
std::vector<BattleBlock> read_all(const std::string& text);

/**
 * Return a fresh, empty directory for test files.
 * The directory is removed when the returned guard goes out of scope.
 */
class TempDirectory
{

public:

	explicit TempDirectory(const std::string& name);
	~TempDirectory();

	TempDirectory(const TempDirectory& ) = delete;
	TempDirectory& operator=(const TempDirectory& ) = delete;

	const std::filesystem::path& path() const noexcept { return m_path; }

	/**
	 * Create a file with the given content in the directory and return its path.
	 */
	std::filesystem::path write_file(const std::string& name, const std::string& content) const;

private:

	std::filesystem::path m_path;

};

/**
 * Mock for examining how often the battle log is read.
 */
class MockBattleSource : public IBattleSource
{

public:

	MOCK_METHOD(std::unique_ptr<std::istream>, open, (), (const, override));
	MOCK_METHOD(std::string, name, (), (const, override));

};
