// Expected: 6 findings from unnecessary-const.

struct Point {
    int x;
    int y;
};

int scale(const int factor, int value) {           // parameter
    const int base = 10;                            // typed local
    const auto offset = factor * 2;                 // deduced local
    return base * value + offset;
}

int sum(const Point *points, int n) {
    int total = 0;
    for (int i = 0; i < n; ++i)                     // counted loop: ignored
        total += points[i].x;
    int values[] = {1, 2, 3};
    for (const auto v : values)                     // for-each variable
        total += v;
    const auto [a, b] = points[0];                  // structured binding
    return total + a + b;
}

int untouched(const int &ref, int *const ptr) {   // const pointer itself
    static const int kLimit = 4;                    // static: not a local
    return ref + *ptr + kLimit;
}
