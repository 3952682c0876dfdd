#pragma once
#include "Command.hpp"

class PacmanCommand : public Command {
public:
    int run() override;

private:
    static PacmanCommand instance; // Static instance to trigger registration
    PacmanCommand(bool reg=false);

    friend class PacmanCommandTest;
};
