#ifndef INTERACTION_HPP
#define INTERACTION_HPP

#include <iostream>
#include <string>

// Operator side of a session: decisions, chat input and display.
class Interaction {
public:
    virtual ~Interaction() {}

    // Empty answer means yes; anything but y/n asks again.
    virtual bool AskYesNo(const std::string& prompt) = 0;
    virtual std::string AskText(const std::string& prompt) = 0;
    virtual void Notify(const std::string& text) = 0;
};

class ConsoleInteraction : public Interaction {
public:
    ConsoleInteraction(std::istream& in = std::cin, std::ostream& out = std::cout);

    bool AskYesNo(const std::string& prompt) override;
    // Returns "quit" once input is exhausted.
    std::string AskText(const std::string& prompt) override;
    void Notify(const std::string& text) override;
private:
    std::istream& in_;
    std::ostream& out_;
};

#endif // INTERACTION_HPP
