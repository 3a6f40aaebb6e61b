#include "Dabble.h"

int main(int argc, char** argv) {
    Dabble app;
    if (!app.isValid()) return 1;
    app.run();
    return 0;
}
