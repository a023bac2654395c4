#include "Command.hpp"

class ParallelCommand : public Command {
public:
    int run() override;

private:
    friend class CmdTestBase<ParallelCommand>;
    static ParallelCommand instance; // Static instance to trigger registration
    ParallelCommand(bool reg=false);
};
