// Remote path helpers and remote tar command construction.
#include "TestSupport.hpp"
#include "prosftp/ArchiveHelper.hpp"
#include "prosftp/RemotePath.hpp"

using prosftp_test::TestContext;

namespace {

void test_normalize(TestContext &t) {
    t.check(prosftp::normalizeRemote("") == "/", "empty path should become '/'");
    t.check(prosftp::normalizeRemote("/") == "/", "'/' should stay '/'");
    t.check(prosftp::normalizeRemote("//home///luis//") == "/home/luis",
            "repeated and trailing slashes should collapse");
    t.check(prosftp::normalizeRemote("\\srv\\data") == "/srv/data",
            "backslashes should become forward slashes");
    t.check(prosftp::normalizeRemote("rel/dir/") == "rel/dir",
            "relative paths keep their form");
}

void test_join_parent_base(TestContext &t) {
    t.check(prosftp::joinRemote("/", "etc") == "/etc", "join at root");
    t.check(prosftp::joinRemote("/srv/", "a b") == "/srv/a b", "join keeps spaces");
    t.check(prosftp::parentRemote("/srv/data") == "/srv", "parent of nested path");
    t.check(prosftp::parentRemote("/srv") == "/", "parent of top-level path is '/'");
    t.check(prosftp::parentRemote("/") == "/", "parent of '/' is '/'");
    t.check(prosftp::parentRemote("data") == ".", "parent of a bare name is '.'");
    t.check(prosftp::baseNameRemote("/srv/data/") == "data", "basename ignores trailing slash");
    t.check(prosftp::baseNameRemote("/") == "/", "basename of '/' is '/'");
}

void test_within(TestContext &t) {
    t.check(prosftp::isWithinRemote("/home/luis", "/home"), "child is within parent");
    t.check(prosftp::isWithinRemote("/home", "/home"), "path is within itself");
    t.check(!prosftp::isWithinRemote("/homework", "/home"), "prefix match is not containment");
    t.check(prosftp::isWithinRemote("/anything", "/"), "everything absolute is within '/'");
}

void test_shell_quote(TestContext &t) {
    t.check(prosftp::shellQuote("plain") == "'plain'", "plain word is wrapped in quotes");
    t.check(prosftp::shellQuote("it's") == "'it'\\''s'", "embedded quote is escaped");
    t.check(prosftp::shellQuote("$(rm -rf /)") == "'$(rm -rf /)'",
            "command substitution stays literal");
}

void test_remote_commands(TestContext &t) {
    t.check(prosftp::archive::compressCommand("/srv/data", "/tmp/data_1.tar.gz") ==
                "tar -czf '/tmp/data_1.tar.gz' -C '/srv' 'data'",
            "compress command should tar the basename from the parent");
    t.check(prosftp::archive::compressCommand("/data/", "/tmp/x.tar.gz") ==
                "tar -czf '/tmp/x.tar.gz' -C '/' 'data'",
            "top-level folder should use '/' as parent");
    t.check(prosftp::archive::compressCommand("/srv/-rf", "/tmp/x.tar.gz") ==
                "tar -czf '/tmp/x.tar.gz' -C '/srv' './-rf'",
            "a leading dash must not be read as an option");
    t.check(prosftp::archive::extractCommand("/up/my dir.tar.gz", "/up") ==
                "tar -xzf '/up/my dir.tar.gz' -C '/up'",
            "extract command should quote paths with spaces");
    t.checkContains(prosftp::archive::compressCommand("/srv/o'neil", "/tmp/a.tar.gz"),
                    "'o'\\''neil'", "single quotes in names should be escaped");
}

void test_unique_suffix(TestContext &t) {
    const std::string a = prosftp::archive::uniqueSuffix();
    const std::string b = prosftp::archive::uniqueSuffix();
    t.check(a != b, "two suffixes should differ");
    const auto us = a.find('_');
    t.check(us != std::string::npos && a.size() - us - 1 == 8,
            "suffix should be '<seconds>_<8 hex>'");
}

} // namespace

int main() {
    TestContext t;
    test_normalize(t);
    test_join_parent_base(t);
    test_within(t);
    test_shell_quote(t);
    test_remote_commands(t);
    test_unique_suffix(t);
    return t.finish("prosftp_remote_path_tests");
}
