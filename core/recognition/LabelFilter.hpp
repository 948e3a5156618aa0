#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <QByteArray>
#include <QFile>
#include <QString>
#include <QStringList>
#include <QVector>
#include "Errors.hpp"
#include "utils/Logger.hpp"

namespace kc {

class LabelFilterPolicy {
public:
    virtual ~LabelFilterPolicy() = default;
    virtual bool accepts(char32_t codepoint) const = 0;
};

// Closed code point range, Hiragana by default.
class UnicodeRangePolicy : public LabelFilterPolicy {
public:
    explicit UnicodeRangePolicy(char32_t first = 0x3040, char32_t last = 0x309F)
        : m_first(first), m_last(last) {}

    bool accepts(char32_t codepoint) const override {
        return codepoint >= m_first && codepoint <= m_last;
    }

    char32_t first() const { return m_first; }
    char32_t last() const { return m_last; }

private:
    char32_t m_first;
    char32_t m_last;
};

// Class labels in class-index order.
class LabelTable {
public:
    LabelTable() = default;
    explicit LabelTable(std::vector<std::string> labels) : m_labels(std::move(labels)) {}

    // One label per line, line index = class index. Trailing blank lines are
    // dropped; blank lines in between keep their slot.
    static LabelTable fromFile(const std::string &path) {
        QFile file(QString::fromStdString(path));
        if (!file.open(QIODevice::ReadOnly))
            throw InitializationError("Failed to open label file " + path);
        const QByteArray bytes = file.readAll();
        file.close();
        return fromText(bytes.toStdString());
    }

    static LabelTable fromText(const std::string &utf8) {
        QStringList lines = QString::fromUtf8(utf8.c_str(), static_cast<int>(utf8.size()))
                                .split(QLatin1Char('\n'));
        for (QString &line : lines) {
            if (line.endsWith(QLatin1Char('\r')))
                line.chop(1);
        }
        while (!lines.isEmpty() && lines.last().trimmed().isEmpty())
            lines.removeLast();
        std::vector<std::string> labels;
        labels.reserve(static_cast<size_t>(lines.size()));
        for (const QString &line : lines)
            labels.push_back(line.toStdString());
        return LabelTable(std::move(labels));
    }

    size_t size() const { return m_labels.size(); }
    bool empty() const { return m_labels.empty(); }
    const std::string &label(size_t index) const { return m_labels.at(index); }
    const std::vector<std::string> &labels() const { return m_labels; }

private:
    std::vector<std::string> m_labels;
};

struct FilteredEntry {
    size_t classIndex;
    std::string glyph;
};

// Class index -> glyph for the classes of the target alphabet, ascending by
// class index. Built once, read-only afterwards.
class FilteredIndex {
public:
    static FilteredIndex build(const LabelTable &table, const LabelFilterPolicy &policy) {
        if (table.empty())
            throw InitializationError("Label list is empty");
        FilteredIndex index;
        index.m_classCount = table.size();
        for (size_t i = 0; i < table.size(); ++i) {
            // Only the leading character of a label is significant.
            const QVector<uint> codepoints = QString::fromStdString(table.label(i)).toUcs4();
            if (codepoints.isEmpty())
                continue;
            const char32_t lead = static_cast<char32_t>(codepoints.front());
            if (!policy.accepts(lead))
                continue;
            index.m_entries.push_back({i, QString::fromUcs4(&lead, 1).toStdString()});
        }
        if (index.m_entries.empty())
            throw InitializationError("No label falls inside the target alphabet");
        KC_LOG(LogLevel::Info, "Label table: " + std::to_string(table.size()) +
                                   " classes, " + std::to_string(index.m_entries.size()) +
                                   " in target alphabet");
        return index;
    }

    const std::vector<FilteredEntry> &entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    size_t classCount() const { return m_classCount; }

private:
    FilteredIndex() = default;

    std::vector<FilteredEntry> m_entries;
    size_t m_classCount{0};
};

} // namespace kc
