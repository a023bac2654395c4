#include "Command.hpp"

class NestedCommand : public Command {
public:
    int run() override;

private:
    friend class CmdTestBase<NestedCommand>;
    static NestedCommand instance; // Static instance to trigger registration
    NestedCommand(bool reg=false);
};
