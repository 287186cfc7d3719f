/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "../src/database.h"
#include "../src/util/log.h"
#include "../src/util/logmanager.h"

using namespace tsbtreedb;
using namespace std;

namespace {

    void usage() {
        cerr << "usage: tsbtreedb_cli [--log-file PATH] <file> <command> [args]\n"
             << "commands:\n"
             << "  get KEY        print the value stored under KEY\n"
             << "  set KEY VALUE  store VALUE under KEY and commit\n"
             << "  min | max      print the value of the smallest / largest key\n"
             << "  left KEY       print the left child of KEY\n"
             << "  right KEY      print the right child of KEY\n"
             << "  chop KEY       print every entry with key <= KEY\n"
             << "  dump           print every entry in key order\n";
    }

    // Integers when the whole argument parses as one, then doubles, else strings
    Key parse_key(const string& s) {
        if (!s.empty()) {
            char* end = nullptr;
            errno = 0;
            long long i = strtoll(s.c_str(), &end, 10);
            if (errno == 0 && end && *end == '\0') {
                return Key(static_cast<int64_t>(i));
            }

            errno = 0;
            double d = strtod(s.c_str(), &end);
            if (errno == 0 && end && *end == '\0' && d == d) {
                return Key(d);
            }
        }
        return Key(s);
    }

    void print_entries(const BinaryTree::Entries& entries) {
        for (const auto& e : entries) {
            cout << e.first << '\t' << e.second << '\n';
        }
    }

    int run(Database& db, const string& cmd, const vector<string>& args) {
        auto need = [&](size_t n) {
            if (args.size() != n) {
                usage();
                return false;
            }
            return true;
        };

        if (cmd == "get") {
            if (!need(1)) return 2;
            cout << db.get(parse_key(args[0])) << '\n';
        } else if (cmd == "set") {
            if (!need(2)) return 2;
            db.set(parse_key(args[0]), args[1]);
            db.commit();
        } else if (cmd == "min") {
            if (!need(0)) return 2;
            cout << db.get_min() << '\n';
        } else if (cmd == "max") {
            if (!need(0)) return 2;
            cout << db.get_max() << '\n';
        } else if (cmd == "left" || cmd == "right") {
            if (!need(1)) return 2;
            Key k = parse_key(args[0]);
            auto e = (cmd == "left") ? db.get_left(k) : db.get_right(k);
            cout << e.first << '\t' << e.second << '\n';
        } else if (cmd == "chop") {
            if (!need(1)) return 2;
            print_entries(db.chop(parse_key(args[0])));
        } else if (cmd == "dump") {
            if (!need(0)) return 2;
            print_entries(db.items());
        } else {
            usage();
            return 2;
        }
        return 0;
    }

} // namespace

int main(int argc, char** argv) {
    initLoggingFromEnv();

    vector<string> positional;
    string log_file;
    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if (arg == "--log-file") {
            if (i + 1 >= argc) {
                usage();
                return 2;
            }
            log_file = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        usage();
        return 2;
    }

    try {
        unique_ptr<LogManager> log_manager;
        if (!log_file.empty()) {
            log_manager.reset(new LogManager(log_file));
        }

        auto db = connect(positional[0]);
        vector<string> args(positional.begin() + 2, positional.end());
        int rc = run(*db, positional[1], args);
        db->close();
        return rc;
    } catch (const DatabaseError& e) {
        cerr << "error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        cerr << "error: " << e.what() << '\n';
        return 1;
    }
}
