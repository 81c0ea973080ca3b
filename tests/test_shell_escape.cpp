#include <gtest/gtest.h>
#include <taskchain/exec/shell_escape.hpp>

using namespace taskchain;

TEST(ShellEscape, PlainCommandUnchanged) {
    EXPECT_EQ(escape_shell_command("php artisan migrate --force"), "php artisan migrate --force");
}

TEST(ShellEscape, MetacharactersEscaped) {
    EXPECT_EQ(escape_shell_command("ls | grep x"), "ls \\| grep x");
    EXPECT_EQ(escape_shell_command("echo $HOME; rm *"), "echo \\$HOME\\; rm \\*");
    EXPECT_EQ(escape_shell_command("a && b > c"), "a \\&\\& b \\> c");
}

TEST(ShellEscape, PairedQuotesKept) {
    EXPECT_EQ(escape_shell_command("echo 'a b'"), "echo 'a b'");
    EXPECT_EQ(escape_shell_command("echo \"a b\""), "echo \"a b\"");
}

TEST(ShellEscape, UnpairedQuotesEscaped) {
    EXPECT_EQ(escape_shell_command("echo it's"), "echo it\\'s");
    EXPECT_EQ(escape_shell_command("echo \"it's\""), "echo \"it\\'s\"");
}
