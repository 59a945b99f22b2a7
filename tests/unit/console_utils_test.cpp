#include "ConsoleUtils.hpp"
#include "keyward/core/KdfPolicy.hpp"
#include "keyward/crypto/providers/NativeProviderFactory.hpp"
#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <span>
#include <sstream>
#include <string_view>

#include <sys/mman.h>
#include <sys/resource.h>

namespace
{

constexpr rlim_t g_lowMemlockBytes{ 8U * 1024U * 1024U };

} // namespace

struct StreamRedirector
{
    std::streambuf* oldCin;
    std::streambuf* oldCout;
    std::stringstream input;
    std::stringstream output;

    explicit StreamRedirector(const std::string& inputData) : oldCin(std::cin.rdbuf()), oldCout(std::cout.rdbuf())
    {
        input << inputData;
        std::cin.rdbuf(input.rdbuf());
        std::cout.rdbuf(output.rdbuf());
    }

    ~StreamRedirector()
    {
        std::cin.rdbuf(oldCin);
        std::cout.rdbuf(oldCout);
    }
};

TEST(ConsoleUtilsTest, FuturePagesArePinnedOnlyUnderUnlimitedMemlock)
{
    using keyward::ui::cli::MemoryLock;
    EXPECT_EQ(keyward::ui::cli::chooseMemoryLock(RLIM_INFINITY), MemoryLock::All);
    EXPECT_EQ(keyward::ui::cli::chooseMemoryLock(g_lowMemlockBytes), MemoryLock::CurrentOnly);
    EXPECT_EQ(keyward::ui::cli::chooseMemoryLock(0U), MemoryLock::CurrentOnly);
}

TEST(ConsoleUtilsTest, DefaultKdfStillRunsAfterHardeningUnderLowMemlockLimit)
{
    struct rlimit saved
    {
    };
    ASSERT_EQ(::getrlimit(RLIMIT_MEMLOCK, &saved), 0);
    struct rlimit lowered
    {
        saved
    };
    if (lowered.rlim_cur == RLIM_INFINITY || lowered.rlim_cur > g_lowMemlockBytes)
    {
        lowered.rlim_cur = g_lowMemlockBytes;
    }
    ASSERT_EQ(::setrlimit(RLIMIT_MEMLOCK, &lowered), 0);

    const auto hardening{ keyward::ui::cli::hardenProcess() };
    EXPECT_NE(hardening.memory, keyward::ui::cli::MemoryLock::All);

    // The default work area is far larger than the lowered limit.
    auto provider{ keyward::crypto::providers::makeNativeCryptoProvider() };
    const std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes> salt{};
    constexpr std::string_view kPassphrase{ "correct horse battery staple" };
    const std::span<const std::byte> passphrase{ reinterpret_cast<const std::byte*>(kPassphrase.data()),
                                                 kPassphrase.size() };
    try
    {
        const auto key{ provider->deriveKey(passphrase, salt, keyward::core::defaultArgon2idParams()) };
        EXPECT_EQ(key.size(), keyward::crypto::g_derivedKeyBytes);
    }
    catch (const std::exception& e)
    {
        ADD_FAILURE() << "key derivation failed after hardening: " << e.what();
    }

    (void)::munlockall();
    EXPECT_EQ(::setrlimit(RLIMIT_MEMLOCK, &saved), 0);
}

TEST(ConsoleUtilsTest, ReadPasswordFromExplicitStreams)
{
    std::istringstream in{ "correct horse\nnext line\n" };
    std::ostringstream out;

    const auto result = keyward::ui::cli::readPassword("Master passphrase: ", in, out);

    EXPECT_EQ(keyward::security::asStringView(result), "correct horse");
    EXPECT_EQ(out.str(), "Master passphrase: ");

    std::string rest;
    std::getline(in, rest);
    EXPECT_EQ(rest, "next line");
}

TEST(ConsoleUtilsTest, ReadPasswordConsumesStdinAndPrintsPrompt)
{
    StreamRedirector redirect("secret123\n");

    const std::string prompt = "Enter Password: ";
    const auto result = keyward::ui::cli::readPassword(prompt);

    EXPECT_EQ(keyward::security::asStringView(result), "secret123");
    EXPECT_EQ(redirect.output.str().rfind(prompt, 0), 0U);
}

TEST(ConsoleUtilsTest, ReadPasswordHandlesEmptyInputAndEof)
{
    std::istringstream blank{ "\n" };
    std::istringstream eof{ "" };
    std::ostringstream out;

    EXPECT_TRUE(keyward::ui::cli::readPassword("Pass: ", blank, out).empty());
    EXPECT_TRUE(keyward::ui::cli::readPassword("Pass: ", eof, out).empty());
}
