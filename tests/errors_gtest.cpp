// GoogleTest unit tests for native error translation and the log facade
#include "nativeudp/Errors.hpp"
#include "nativeudp/Log.hpp"
#include "nativeudp/NativeIoException.hpp"
#include "nativeudp/PortUnreachableException.hpp"
#include "nativeudp/UnsupportedOperationException.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace nativeudp;

namespace
{

class CapturingSink final : public LogSink
{
  public:
    struct Entry
    {
        LogLevel level;
        std::string tag;
        std::string message;
    };
    std::vector<Entry> entries;

    void write(const LogLevel level, const std::string_view tag, const std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }
};

class LogTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        _previous = Log::level();
        sink = std::make_shared<CapturingSink>();
        Log::setSink(sink);
    }

    void TearDown() override
    {
        Log::setSink(nullptr);
        Log::setLevel(_previous);
    }

    std::shared_ptr<CapturingSink> sink;

  private:
    LogLevel _previous = LogLevel::Warn;
};

} // namespace

TEST(ErrorsTest, ConnectionRefusedBecomesPortUnreachable)
{
    const NativeIoException native("recv", ECONNREFUSED);
    const std::exception_ptr translated = translateConnectedReadError(native);
    try
    {
        std::rethrow_exception(translated);
    }
    catch (const PortUnreachableException& e)
    {
        EXPECT_EQ(e.getErrorCode(), ECONNREFUSED);
        ASSERT_TRUE(e.getNestedException());
        EXPECT_THROW(std::rethrow_exception(e.getNestedException()), NativeIoException);
        return;
    }
    catch (const std::exception& e)
    {
        FAIL() << "unexpected exception type: " << e.what();
    }
}

TEST(ErrorsTest, OtherErrorsStayNative)
{
    const NativeIoException native("recv", EBADF);
    try
    {
        std::rethrow_exception(translateConnectedReadError(native));
    }
    catch (const PortUnreachableException&)
    {
        FAIL() << "EBADF must not be reported as port unreachable";
    }
    catch (const NativeIoException& e)
    {
        EXPECT_EQ(e.getErrorCode(), EBADF);
        EXPECT_EQ(e.call(), "recv");
    }
}

TEST(ErrorsTest, NativeMessageNamesCall)
{
    const NativeIoException e("sendmsg", EMSGSIZE);
    EXPECT_EQ(std::string(e.what()).rfind("sendmsg() failed: ", 0), 0u);
}

TEST(ErrorsTest, UnsupportedOperationIsLogicError)
{
    EXPECT_THROW(throw UnsupportedOperationException("nope"), std::logic_error);
}

TEST(ErrorsTest, SocketExceptionFormatsCode)
{
    const SocketException e(42, "boom");
    EXPECT_EQ(std::string(e.what()), "boom (error code 42)");
    EXPECT_EQ(e.getErrorCode(), 42);
}

TEST_F(LogTest, ThresholdFiltersMessages)
{
    Log::setLevel(LogLevel::Warn);
    Log::debug("test", "hidden");
    Log::info("test", "hidden");
    Log::warn("test", "shown");
    Log::error("test", "shown too");
    ASSERT_EQ(sink->entries.size(), 2u);
    EXPECT_EQ(sink->entries[0].level, LogLevel::Warn);
    EXPECT_EQ(sink->entries[0].tag, "test");
    EXPECT_EQ(sink->entries[1].message, "shown too");
}

TEST_F(LogTest, OffSilencesEverything)
{
    Log::setLevel(LogLevel::Off);
    Log::error("test", "hidden");
    EXPECT_TRUE(sink->entries.empty());
    EXPECT_FALSE(Log::enabled(LogLevel::Error));
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(parseLogLevel("DEBUG", LogLevel::Off), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Info", LogLevel::Off), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn", LogLevel::Off), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error", LogLevel::Off), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off", LogLevel::Debug), LogLevel::Off);
    EXPECT_EQ(parseLogLevel("verbose", LogLevel::Info), LogLevel::Info);
}
