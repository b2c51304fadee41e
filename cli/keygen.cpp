/*
 * ocrd - Secret and password hash generator (ocrd-keygen)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/credentials.hpp"
#include "ocrd/token.hpp"
#include <iostream>

using namespace ocrd;

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " secret [bytes]     print a random hex secret_key (default 32 bytes)\n";
    std::cout << "       " << progName << " hash <password>    print a bcrypt hash for the users list\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "secret" && argc <= 3) {
            std::size_t bytes = 32;
            if (argc == 3) {
                int requested = std::stoi(argv[2]);
                if (requested < 16 || requested > 1024) {
                    std::cerr << "Error: bytes must be between 16 and 1024\n";
                    return 1;
                }
                bytes = static_cast<std::size_t>(requested);
            }
            std::cout << TokenService::generateSecret(bytes) << "\n";
            return 0;
        }
        if (command == "hash" && argc == 3) {
            std::cout << CredentialStore::hash(argv[2]) << "\n";
            return 0;
        }
        if (command == "-h" || command == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    printUsage(argv[0]);
    return 1;
}
