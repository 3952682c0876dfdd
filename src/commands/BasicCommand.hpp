#pragma once
#include "Command.hpp"

class BasicCommand : public Command {
public:
    int run() override;

private:
    static BasicCommand instance; // Static instance to trigger registration
    BasicCommand(bool reg=false);
};
