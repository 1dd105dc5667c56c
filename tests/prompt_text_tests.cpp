// Pure text rules checked against literal device transcripts (run via CTest).
#include "sroscli/PromptText.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <string>
#include <vector>

namespace {

using namespace sroscli;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkEq(const std::string &got, const std::string &want,
                 const std::string &msg) {
        check(got == want, msg + " (got '" + got + "', want '" + want + "')");
    }
};

void test_classify_by_marker(TestContext &t) {
    const std::vector<std::string> bodies = {
        "", "A", "A:node-1", "*A:node-1>config>router#",
        "B:a-very-long-hostname.example.net-with-many-parts#"};
    for (const auto &body : bodies) {
        t.check(prompt::classifyPrompt(body) == CliMode::Classical,
                "prompt without '@' should be classical: " + body);
        for (std::size_t pos = 0; pos <= body.size(); ++pos) {
            std::string marked = body;
            marked.insert(pos, 1, '@');
            t.check(prompt::classifyPrompt(marked) == CliMode::ModelDriven,
                    "prompt with '@' should be model-driven: " + marked);
        }
    }
}

void test_normalize_known_prompts(TestContext &t) {
    std::string out;
    t.check(prompt::normalizeBasePrompt("*A:node-1#", out),
            "classical prompt should normalize");
    t.checkEq(out, "A:node-1", "leading '*' and '#' should be stripped");

    t.check(prompt::normalizeBasePrompt("*A:node-1@>config#", out),
            "model-driven navigation prompt should normalize");
    t.checkEq(out, "A:node-1", "'@' marker and '>config' should be stripped");

    t.check(prompt::normalizeBasePrompt("*A:node-1>config>router#", out),
            "nested navigation should normalize");
    t.checkEq(out, "A:node-1", "every '>' suffix should be stripped");

    t.check(prompt::normalizeBasePrompt("A:admin@node-1# ", out),
            "md-cli user@host prompt should normalize");
    t.checkEq(out, "A:admin@node-1", "user@host core should be kept");
}

void test_normalize_no_match_keeps_raw(TestContext &t) {
    std::string out;
    t.check(!prompt::normalizeBasePrompt("login:", out),
            "prompt without '#' should not normalize");
    t.checkEq(out, "login:", "raw prompt should be returned on no match");

    t.check(!prompt::normalizeBasePrompt("*#", out),
            "prompt with empty core should not normalize");
    t.checkEq(out, "*#", "empty core keeps raw prompt");
}

void test_normalize_deep_navigation(TestContext &t) {
    std::string path;
    for (int i = 0; i < 64; ++i)
        path += ">x";

    const auto start = std::chrono::steady_clock::now();
    std::string out;
    t.check(prompt::normalizeBasePrompt("*A:node-1" + path + "#", out),
            "deep navigation prompt should normalize");
    t.checkEq(out, "A:node-1", "deep navigation suffix is dropped");

    const std::string shellPrompt = "A:node-1" + path + "$";
    t.check(!prompt::normalizeBasePrompt(shellPrompt, out),
            "prompt without '#' should not normalize");
    t.checkEq(out, shellPrompt, "prompt without '#' is kept raw");
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    t.check(elapsed.count() < 1000, "normalization of deep prompts should be fast, took " +
                                        std::to_string(elapsed.count()) + " ms");
}

void test_any_prompt_terminator(TestContext &t) {
    const std::regex re(prompt::kAnyPromptPattern);
    t.check(std::regex_search(std::string("\nA:node-1# "), re), "'#' terminator");
    t.check(std::regex_search(std::string("\nrouter> "), re), "'>' terminator");
    t.check(std::regex_search(std::string("\n[admin@host ~]$ "), re), "'$' terminator");
    t.check(!std::regex_search(std::string("A:node-1# \nmore output"), re),
            "terminator must end the buffer");
}

void test_normalize_idempotent(TestContext &t) {
    const std::vector<std::string> raws = {
        "*A:node-1#", "*A:node-1@>config#", "A:admin@node-1#",
        "*A:node-1>config>router>bgp#", "B:pe-2>show#", "A:node-1",
        "**A:x#", "login:"};
    for (const auto &raw : raws) {
        std::string once;
        std::string twice;
        prompt::normalizeBasePrompt(raw, once);
        prompt::normalizeBasePrompt(once, twice);
        t.checkEq(twice, once, "normalization should be idempotent for " + raw);
    }
}

void test_config_markers(TestContext &t) {
    const std::string clean = "exit all\n\n(ex)[/]\nA:admin@node-1# ";
    const std::string dirty = "exit all\n\n*(ex)[/]\nA:admin@node-1# ";
    const std::string oper = "exit all\n\n[/]\nA:admin@node-1# ";

    t.check(prompt::inConfigContext(clean), "(ex)[ marks config mode");
    t.check(!prompt::hasUncommittedChanges(clean), "no '*' means no changes");
    t.check(prompt::inConfigContext(dirty), "*(ex)[ is still config mode");
    t.check(prompt::hasUncommittedChanges(dirty), "*(ex)[ marks changes");
    t.check(!prompt::inConfigContext(oper), "[/] alone is operational");

    t.check(prompt::configStateFromOutput(oper) == ConfigState::Operational,
            "operational state");
    t.check(prompt::configStateFromOutput(clean) == ConfigState::ConfigActive,
            "active state");
    t.check(prompt::configStateFromOutput(dirty) == ConfigState::ConfigDirty,
            "dirty state");
}

void test_strip_decoration(TestContext &t) {
    t.checkEq(prompt::stripContextDecoration("Completed.\n\n*(ex)[/]\n"),
              "Completed.", "dirty exclusive breadcrumb should go");
    t.checkEq(prompt::stripContextDecoration("line\n!(gl)[/configure]"),
              "line", "global breadcrumb with '!' should go");
    t.checkEq(prompt::stripContextDecoration("x\n(pr)[/configure/router]\n"),
              "x", "private breadcrumb should go");
    t.checkEq(prompt::stripContextDecoration("x\n[/]\n"), "x",
              "untagged root breadcrumb should go");
    t.checkEq(prompt::stripContextDecoration("no breadcrumbs here"),
              "no breadcrumbs here", "plain output should be untouched");
}

void test_strip_echo_and_prompt(TestContext &t) {
    const std::string raw = "show uptime\nSystem Up Time : 3 days\n\nA:admin@node-1# ";
    const std::string noPrompt =
        prompt::stripTrailingPrompt(raw, "A:admin@node-1");
    t.checkEq(noPrompt, "show uptime\nSystem Up Time : 3 days\n",
              "trailing prompt line should be removed");
    t.checkEq(prompt::stripCommandEcho(noPrompt, "show uptime"),
              "System Up Time : 3 days\n", "echo line should be removed");

    t.checkEq(prompt::stripTrailingPrompt("data\nother#", "A:node-1"),
              "data\nother#", "line without base prompt should stay");
    t.checkEq(prompt::stripCommandEcho("data\n", "show x"), "data\n",
              "output without echo should stay");
}

void test_terminal_output_normalization(TestContext &t) {
    t.checkEq(prompt::normalizeTerminalOutput("a\r\nb\x1b[0mc\x1b[1;32md"),
              "a\nbcd", "CR and CSI sequences should be removed");
    t.checkEq(prompt::normalizeTerminalOutput("tail\x1b["), "tail\x1b[",
              "incomplete escape should wait for more data");
    t.checkEq(prompt::normalizeTerminalOutput("x\x1b" "7y"), "xy",
              "two-byte escape should be removed");
}

void test_escape_regex(TestContext &t) {
    const std::string literal = "//file dir cf3:/a.b(1)+[x]";
    const std::regex re(prompt::escapeRegex(literal));
    t.check(std::regex_search("echo " + literal + "\n", re),
            "escaped literal should match itself");
    t.check(!std::regex_search(std::string("//file dir cf3:/aXb(1)+[x]"), re),
            "escaped '.' should not match any character");
}

void test_last_line(TestContext &t) {
    t.checkEq(prompt::lastLine("\n[/]\nA:admin@node-1# \n\n"),
              "A:admin@node-1#", "last non-empty line, trimmed");
    t.checkEq(prompt::lastLine("  \n "), "", "blank output has no line");
}

void test_listing_size(TestContext &t) {
    const std::string listing =
        "Volume in drive cf3 on slot A is SROS VM.\n\n"
        "Directory of cf3:\\\n\n"
        "10/16/2019  10:00p                6738 config.cfg\n"
        "10/16/2019  09:12p                 912 config.cfg.bak\n"
        "               2 File(s)                   7650 bytes.\n"
        "               0 Dir(s)               961531904 bytes free.\n";
    std::uint64_t size = 0;
    CliError err;
    t.check(prompt::parseListingSize(listing, "config.cfg", size, err),
            "config.cfg should be found");
    t.check(size == 6738, "config.cfg size should be 6738");
    t.check(prompt::parseListingSize(listing, "config.cfg.bak", size, err),
            "config.cfg.bak should be found");
    t.check(size == 912, "config.cfg.bak size should be 912");

    err.clear();
    t.check(!prompt::parseListingSize(listing, "boot.ldr", size, err),
            "absent file should fail");
    t.check(err.kind == CliErrorKind::Parse, "absent file is a parse error");

    err.clear();
    t.check(!prompt::parseListingSize("10/16/2019  10:00p  6738 config.cfg.old",
                                      "config.cfg", size, err),
            "prefix of a longer name should not match");
}

void test_free_space(TestContext &t) {
    std::uint64_t bytes = 0;
    CliError err;
    t.check(prompt::parseFreeSpace(
                "               3 Dir(s)               961531904 bytes free.",
                R"((\d+)\s+\w+\s+free)", bytes, err),
            "free space should parse");
    t.check(bytes == 961531904ULL, "free space should be 961531904");

    err.clear();
    t.check(!prompt::parseFreeSpace("nothing useful", R"((\d+)\s+\w+\s+free)",
                                    bytes, err),
            "missing free space should fail");
    t.check(err.kind == CliErrorKind::Parse, "missing free space is a parse error");

    err.clear();
    t.check(!prompt::parseFreeSpace("1 bytes free", "((", bytes, err),
            "invalid pattern should fail");
    t.check(err.kind == CliErrorKind::Parse, "invalid pattern is a parse error");

    err.clear();
    t.check(!prompt::parseFreeSpace("99999999999999999999999 bytes free",
                                    R"((\d+)\s+\w+\s+free)", bytes, err),
            "overflowing number should fail");
}

void test_classify_listing(TestContext &t) {
    t.check(prompt::classifyListing("File Not Found", "a.cfg") ==
                prompt::ListingPresence::Missing,
            "File Not Found means missing");
    t.check(prompt::classifyListing("10/16/2019  10:00p   6738 a.cfg", "a.cfg") ==
                prompt::ListingPresence::Present,
            "file name in output means present");
    t.check(prompt::classifyListing("MINOR: CLI Command not allowed", "a.cfg") ==
                prompt::ListingPresence::Unknown,
            "anything else is unknown");
}

} // namespace

int main() {
    TestContext t;
    test_classify_by_marker(t);
    test_normalize_known_prompts(t);
    test_normalize_no_match_keeps_raw(t);
    test_normalize_deep_navigation(t);
    test_any_prompt_terminator(t);
    test_normalize_idempotent(t);
    test_config_markers(t);
    test_strip_decoration(t);
    test_strip_echo_and_prompt(t);
    test_terminal_output_normalization(t);
    test_escape_regex(t);
    test_last_line(t);
    test_listing_size(t);
    test_free_space(t);
    test_classify_listing(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sroscli_prompt_tests\n";
    return EXIT_SUCCESS;
}
