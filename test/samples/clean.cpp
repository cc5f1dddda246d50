// Expected: no findings.

int accumulate(int *data, int n) {
    int total = 0;
    for (int i = 0; i < n; ++i)
        total += data[i];
    auto twice = total * 2;
    return twice;
}

int borrow(const int &value, const int *pointer) {
    constexpr int kBias = 1;
    return value + *pointer + kBias;
}
