#include "protocol.h"

int main() {
    isolation::protocol_loop();
    return 0;
}
