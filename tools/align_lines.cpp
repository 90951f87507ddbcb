#include <collate/align.hpp>
#include <collate/common.hpp>
#include <collate/extract.hpp>
#include <collate/report.hpp>
#include <collate/settings.hpp>

#include <iostream>
#include <sstream>

using namespace std;
using namespace ::collate;

// one sentence per line; blank lines are skipped
static vector<string> lines_of(string const& path)
{
    vector<string> lines;
    istringstream in(read_file(path));
    string line;
    while (getline(in, line)) {
        string_view trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.emplace_back(trimmed);
        }
    }
    return lines;
}

int main(int argc, char **argv) {
    if (argc < 3 || argc > 4) {
        cerr << "usage: align_lines LEFT RIGHT [threshold]" << endl;
        return 2;
    }

    try {
        double threshold = argc == 4 ? parse_threshold(argv[3]) : DEFAULT_THRESHOLD;
        Alignment alignment = align(lines_of(argv[1]), lines_of(argv[2]), threshold);
        for (auto & row : render_markup(alignment)) {
            cout << row.left << '\t' << row.right << '\t' << (row.unmatched_left ? "true" : "false") << '\n';
        }
    } catch (exception const& e) {
        cerr << "align_lines: " << e.what() << endl;
        return 1;
    }

    return 0;
}
