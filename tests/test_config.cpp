#include <gtest/gtest.h>
#include <taskchain/core/config.hpp>
#include <sstream>

using namespace taskchain;

TEST(Config, Defaults) {
    ExecutorConfig cfg;
    EXPECT_EQ(cfg.artisan_prefix, "php artisan");
    ASSERT_TRUE(cfg.default_timeout.has_value());
    EXPECT_DOUBLE_EQ(*cfg.default_timeout, 60.0);
    EXPECT_TRUE(cfg.notifications);
    EXPECT_FALSE(cfg.debug);
}

TEST(Config, ParsesKnownKeys) {
    std::istringstream in(
        "# comment\n"
        "artisan_prefix = php8.2 artisan\n"
        "default_timeout=120.5\n"
        "base_path=/srv/app\n"
        "notifications=off\n"
        "notify_icon=/usr/share/icons/app.png\n"
        "http_timeout=5\n"
        "debug=true\n"
        "unknown_key=ignored\n"
        "no equals sign\n");
    ExecutorConfig cfg;
    parse_config(in, cfg);
    EXPECT_EQ(cfg.artisan_prefix, "php8.2 artisan");
    EXPECT_DOUBLE_EQ(*cfg.default_timeout, 120.5);
    EXPECT_EQ(cfg.base_path, "/srv/app");
    EXPECT_FALSE(cfg.notifications);
    EXPECT_EQ(cfg.notify_icon, "/usr/share/icons/app.png");
    EXPECT_EQ(cfg.http_timeout, 5);
    EXPECT_TRUE(cfg.debug);
}

TEST(Config, NoneDisablesTimeout) {
    std::istringstream in("default_timeout=none\n");
    ExecutorConfig cfg;
    parse_config(in, cfg);
    EXPECT_FALSE(cfg.default_timeout.has_value());
}

TEST(Config, InvalidNumberKeepsPrevious) {
    std::istringstream in("default_timeout=soon\nhttp_timeout=later\n");
    ExecutorConfig cfg;
    ::testing::internal::CaptureStderr();
    parse_config(in, cfg);
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_DOUBLE_EQ(*cfg.default_timeout, 60.0);
    EXPECT_EQ(cfg.http_timeout, 30);
    EXPECT_NE(err.find("default_timeout"), std::string::npos);
}

TEST(Config, MissingFileGivesDefaults) {
    auto cfg = load_config("/nonexistent_taskchain_dir/.taskchainrc");
    EXPECT_EQ(cfg.artisan_prefix, "php artisan");
    EXPECT_EQ(load_config("").artisan_prefix, "php artisan");
}
