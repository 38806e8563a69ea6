#include "Problem.h"
#include <cmath>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

InfeasibleItemError::InfeasibleItemError(const std::string& itemId, double weight, double capacity)
    : std::runtime_error("item '" + itemId + "' has weight " + std::to_string(weight) +
                         " which exceeds the bin capacity " + std::to_string(capacity)),
      id(itemId) {}

Problem::Problem(double capacity, std::vector<Item> items)
    : cap(capacity), itemList(std::move(items)) {
    if (!(cap > 0.0) || !std::isfinite(cap)) {
        throw InvalidProblemError("capacity must be a positive number");
    }
    indexById.reserve(itemList.size());
    for (size_t i = 0; i < itemList.size(); ++i) {
        const Item& it = itemList[i];
        if (!(it.weight > 0.0) || !std::isfinite(it.weight)) {
            throw InvalidProblemError("item '" + it.id + "' must have a positive weight");
        }
        if (it.weight > cap) {
            throw InfeasibleItemError(it.id, it.weight, cap);
        }
        if (!indexById.emplace(it.id, (int)i).second) {
            throw InvalidProblemError("duplicate item id '" + it.id + "'");
        }
        totalWeight += it.weight;
    }
}

int Problem::indexOf(const std::string& id) const {
    auto found = indexById.find(id);
    return found == indexById.end() ? -1 : found->second;
}

int Problem::lowerBound() const {
    if (itemList.empty()) return 0;
    // Small epsilon so that 1000 / 100 does not round up to 11
    return (int)std::ceil(totalWeight / cap - 1e-9);
}

// ==========================================
// INPUT FILE READER
// ==========================================
// The input format is a single flat object, so a small recursive-descent
// reader over the text is enough. Unknown top-level keys are skipped.

namespace {

class JsonReader {
public:
    explicit JsonReader(const std::string& text) : s(text), pos(0) {}

    void expect(char c) {
        skipSpace();
        if (pos >= s.size() || s[pos] != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos;
    }

    bool consume(char c) {
        skipSpace();
        if (pos < s.size() && s[pos] == c) { ++pos; return true; }
        return false;
    }

    std::string readString() {
        expect('"');
        std::string out;
        while (pos < s.size() && s[pos] != '"') {
            char c = s[pos++];
            if (c == '\\') {
                if (pos >= s.size()) break;
                char e = s[pos++];
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    case 'b': out += '\b'; break;
                    case 'f': out += '\f'; break;
                    default: out += e; break; // \" \\ \/
                }
            } else {
                out += c;
            }
        }
        if (pos >= s.size()) fail("unterminated string");
        ++pos;
        return out;
    }

    double readNumber() {
        skipSpace();
        size_t start = pos;
        while (pos < s.size() && (std::isdigit((unsigned char)s[pos]) || s[pos] == '-' ||
                                  s[pos] == '+' || s[pos] == '.' || s[pos] == 'e' || s[pos] == 'E')) {
            ++pos;
        }
        if (start == pos) fail("expected a number");
        try {
            size_t used = 0;
            double v = std::stod(s.substr(start, pos - start), &used);
            if (used != pos - start) fail("malformed number");
            return v;
        } catch (const std::logic_error&) {
            fail("malformed number");
        }
        return 0.0;
    }

    // Skips any JSON value (used for keys we do not care about)
    void skipValue() {
        skipSpace();
        if (pos >= s.size()) fail("unexpected end of input");
        char c = s[pos];
        if (c == '"') { readString(); return; }
        if (c == '{' || c == '[') {
            char close = (c == '{') ? '}' : ']';
            ++pos;
            if (consume(close)) return;
            do {
                if (close == '}') { readString(); expect(':'); }
                skipValue();
            } while (consume(','));
            expect(close);
            return;
        }
        if (std::isalpha((unsigned char)c)) {
            while (pos < s.size() && std::isalpha((unsigned char)s[pos])) ++pos;
            return;
        }
        readNumber();
    }

    void finish() {
        skipSpace();
        if (pos != s.size()) fail("trailing characters after the top-level object");
    }

    [[noreturn]] void fail(const std::string& msg) const {
        throw InvalidProblemError("malformed input at offset " + std::to_string(pos) + ": " + msg);
    }

private:
    void skipSpace() {
        while (pos < s.size() && std::isspace((unsigned char)s[pos])) ++pos;
    }

    const std::string& s;
    size_t pos;
};

} // namespace

Problem Problem::parseJson(const std::string& text) {
    JsonReader in(text);
    double capacity = 0.0;
    bool hasCapacity = false, hasItems = false;
    std::vector<Item> items;

    in.expect('{');
    if (!in.consume('}')) {
        do {
            std::string key = in.readString();
            in.expect(':');
            if (key == "capacity") {
                capacity = in.readNumber();
                hasCapacity = true;
            } else if (key == "items") {
                hasItems = true;
                in.expect('{');
                if (!in.consume('}')) {
                    do {
                        Item it;
                        it.id = in.readString();
                        in.expect(':');
                        it.weight = in.readNumber();
                        items.push_back(std::move(it));
                    } while (in.consume(','));
                    in.expect('}');
                }
            } else {
                in.skipValue();
            }
        } while (in.consume(','));
        in.expect('}');
    }
    in.finish();

    if (!hasCapacity) throw InvalidProblemError("missing key 'capacity'");
    if (!hasItems) throw InvalidProblemError("missing key 'items'");
    return Problem(capacity, std::move(items));
}

Problem Problem::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw InvalidProblemError("cannot open input file " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJson(buffer.str());
}

Problem createDemoProblem() {
    // 15 items, capacity 100, total 640 -> at least 7 bins
    return Problem(100.0, {
        {"BRG-01", 40}, {"BRG-02", 55}, {"BRG-03", 25},
        {"BRG-04", 60}, {"BRG-05", 30}, {"BRG-06", 45},
        {"BRG-07", 50}, {"BRG-08", 35}, {"BRG-09", 20},
        {"BRG-10", 70}, {"BRG-11", 15}, {"BRG-12", 65},
        {"BRG-13", 10}, {"BRG-14", 48}, {"BRG-15", 72}
    });
}
