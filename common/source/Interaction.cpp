#include "Interaction.hpp"

#include <algorithm>
#include <cctype>

ConsoleInteraction::ConsoleInteraction(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out) {}

bool ConsoleInteraction::AskYesNo(const std::string& prompt) {
    std::string answer;
    while (true) {
        out_ << prompt << std::flush;
        if (!std::getline(in_, answer)) {
            out_ << "\n";
            return false;
        }

        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (answer.empty() || answer == "y") {
            return true;
        }
        if (answer == "n") {
            return false;
        }
        out_ << "Invalid input\n";
    }
}

std::string ConsoleInteraction::AskText(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return "quit";
    }
    return line;
}

void ConsoleInteraction::Notify(const std::string& text) {
    out_ << text << std::endl;
}
