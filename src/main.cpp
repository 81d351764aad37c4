#include "BreathApp.hpp"

static BreathApp app;

int main(void)
{
    app.run();
    return 0;
}
