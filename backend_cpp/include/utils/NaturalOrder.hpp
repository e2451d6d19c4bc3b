#pragma once
#include <string>
#include <cctype>

namespace repopatch {

// Numeric-aware string comparison: "file2" < "file10".
// Digit runs compare by value, everything else byte-wise. Returns <0, 0, >0.
inline int natural_compare(const std::string& a, const std::string& b) {
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        unsigned char ca = a[i], cb = b[j];

        if (std::isdigit(ca) && std::isdigit(cb)) {
            size_t si = i, sj = j;
            while (si < a.size() && a[si] == '0') ++si;
            while (sj < b.size() && b[sj] == '0') ++sj;

            size_t ei = si, ej = sj;
            while (ei < a.size() && std::isdigit((unsigned char)a[ei])) ++ei;
            while (ej < b.size() && std::isdigit((unsigned char)b[ej])) ++ej;

            // More significant digits means a bigger number
            size_t len_a = ei - si, len_b = ej - sj;
            if (len_a != len_b) return len_a < len_b ? -1 : 1;

            int cmp = a.compare(si, len_a, b, sj, len_b);
            if (cmp != 0) return cmp < 0 ? -1 : 1;

            // Same value: fewer leading zeros first ("7" < "007")
            size_t run_a = ei - i, run_b = ej - j;
            if (run_a != run_b) return run_a < run_b ? -1 : 1;

            i = ei;
            j = ej;
            continue;
        }

        if (ca != cb) return ca < cb ? -1 : 1;
        ++i;
        ++j;
    }

    if (i < a.size()) return 1;
    if (j < b.size()) return -1;
    return 0;
}

// Sibling ordering for tree listings: directories first, then natural order.
inline bool directory_first_less(bool a_is_dir, const std::string& a_name,
                                 bool b_is_dir, const std::string& b_name) {
    if (a_is_dir != b_is_dir) return a_is_dir;
    return natural_compare(a_name, b_name) < 0;
}

}
