#pragma once
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — watch registry behind the F3 overlay (World resource).
//
// Systems register string providers under a section heading at install time;
// DebugSystem evaluates every provider once per drawn frame. No raylib here,
// so the headless test target can use it.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    bool visible = false;

    // Appends a row; the section is created on first use, in call order.
    void watch(const std::string& section,
               const std::string& label,
               Provider fn) {
        if (Section* s = find(section)) {
            s->rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    // Evaluates a single row. Returns "-" when no such row exists.
    std::string read(const std::string& section, const std::string& label) const {
        for (const auto& s : sections_) {
            if (s.title != section) continue;
            for (const auto& r : s.rows) {
                if (r.label == label) return r.fn();
            }
        }
        return "-";
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    Section* find(const std::string& title) {
        for (auto& s : sections_) {
            if (s.title == title) return &s;
        }
        return nullptr;
    }

    std::vector<Section> sections_;
};
