#pragma once
#include "Command.hpp"

class SpinnerCommand : public Command {
public:
    int run() override;

private:
    static SpinnerCommand instance; // Static instance to trigger registration
    SpinnerCommand(bool reg=false);
};
