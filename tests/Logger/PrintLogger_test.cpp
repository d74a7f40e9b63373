/*
 * Tube Uploader - Logger Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include <TubeUploader/Logger/NullLogger.hpp>
#include <TubeUploader/Logger/PrintLogger.hpp>

using namespace TubeUploader::Logger;

TEST(PrintLoggerTest, WritesNameAndFields)
{
	std::ostringstream os;
	const PrintLogger logger(LogLevel::Info, os);

	logger.info("UploadProgress", {{"acknowledged", "4"}, {"total", "10"}});

	const std::string line = os.str();
	EXPECT_NE(line.find("level=INFO"), std::string::npos);
	EXPECT_NE(line.find("name=UploadProgress"), std::string::npos);
	EXPECT_NE(line.find("acknowledged=4"), std::string::npos);
	EXPECT_NE(line.find("total=10"), std::string::npos);
	EXPECT_EQ(line.back(), '\n');
	EXPECT_EQ(line.find("location="), std::string::npos);
}

TEST(PrintLoggerTest, DropsEventsBelowMinimumLevel)
{
	std::ostringstream os;
	const PrintLogger logger(LogLevel::Warn, os);

	logger.debug("Hidden");
	logger.info("AlsoHidden");
	logger.warn("Shown");

	EXPECT_EQ(os.str().find("Hidden"), std::string::npos);
	EXPECT_NE(os.str().find("name=Shown"), std::string::npos);
}

TEST(PrintLoggerTest, DebugLevelAddsSourceLocation)
{
	std::ostringstream os;
	const PrintLogger logger(LogLevel::Debug, os);

	logger.debug("Traced");

	EXPECT_NE(os.str().find("location="), std::string::npos);
	EXPECT_NE(os.str().find("PrintLogger_test.cpp"), std::string::npos);
}

TEST(PrintLoggerTest, LogExceptionRecordsMessage)
{
	std::ostringstream os;
	const PrintLogger logger(LogLevel::Info, os);

	logger.logException(std::runtime_error("boom"), "Failed");

	EXPECT_NE(os.str().find("level=ERROR"), std::string::npos);
	EXPECT_NE(os.str().find("exception=boom"), std::string::npos);
}

TEST(NullLoggerTest, InstanceIsShared)
{
	EXPECT_EQ(NullLogger::instance(), NullLogger::instance());
	NullLogger::instance()->error("Ignored", {{"key", "value"}});
}
