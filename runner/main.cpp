#include "cmd_serve.h"
#include "cmd_worker.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "execq_cli <serve|worker|exec|reconcile> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "worker") return cmd_worker(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "reconcile") return cmd_reconcile(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
