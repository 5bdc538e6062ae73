// Tests for TextOutput formatting and lifecycle

#include "voxkey/text_output.hpp"
#include <iostream>
#include <cassert>

using namespace voxkey;

void test_first_utterance_has_no_space() {
    std::cout << "Testing first utterance..." << std::endl;

    assert(TextOutput::format_utterance("Hello world.", true, true) == "Hello world.");
    assert(TextOutput::format_utterance("Hello world.", false, true) == "Hello world.");

    std::cout << "  PASS" << std::endl;
}

void test_following_utterances() {
    std::cout << "Testing following utterances..." << std::endl;

    assert(TextOutput::format_utterance("Next one.", true, false) == " Next one.");
    assert(TextOutput::format_utterance("Next one.", false, false) == "Next one.");
    assert(TextOutput::format_utterance("", true, false) == "");

    std::cout << "  PASS" << std::endl;
}

void test_shutdown() {
    std::cout << "Testing type_text after shutdown..." << std::endl;

    TextOutput output(false, true);
    assert(output.type_text(""));
    output.shutdown();
    assert(!output.type_text("too late"));
    output.shutdown();

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Text Output Test Suite ===" << std::endl << std::endl;

    test_first_utterance_has_no_space();
    test_following_utterances();
    test_shutdown();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
