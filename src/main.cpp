#include "db.hpp"
#include "errors.hpp"
#include <iostream>

int main(int argc, char** argv) {
    Options opts;
    if (argc > 1) opts.dir = argv[1];
    opts.log_level = LogLevel::Info;

    try {
        PlutoDB db(opts);
        for (int i = 0; i < 1000; i++) {
            db.put("k1", "v1");
            db.put("k2", "v2");
            db.put("k3", "v3");

            auto v = db.get("k1");
            std::cout << "get k1: " << (v ? *v : "<missing>") << "\n";

            db.del("k1");
            std::cout << "delete k1\n";

            v = db.get("k1");
            std::cout << "get k1: " << (v ? *v : "key not found") << "\n";
        }
        db.close();
    } catch (const std::exception& e) {
        std::cerr << "plutodb_demo: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
