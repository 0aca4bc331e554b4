#include "almanac/data/HolidayCatalogStorage.hpp"

#include "almanac/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

namespace almanac {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";

QString weekdayCode(Qt::DayOfWeek weekday)
{
    switch (weekday) {
    case Qt::Monday:
        return QStringLiteral("MO");
    case Qt::Tuesday:
        return QStringLiteral("TU");
    case Qt::Wednesday:
        return QStringLiteral("WE");
    case Qt::Thursday:
        return QStringLiteral("TH");
    case Qt::Friday:
        return QStringLiteral("FR");
    case Qt::Saturday:
        return QStringLiteral("SA");
    case Qt::Sunday:
    default:
        return QStringLiteral("SU");
    }
}

std::optional<Qt::DayOfWeek> weekdayFromCode(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        const auto weekday = static_cast<Qt::DayOfWeek>(day);
        if (weekdayCode(weekday) == normalized) {
            return weekday;
        }
    }
    return std::nullopt;
}

struct RuleFormatter
{
    QString operator()(const AnnualDate &) const { return QStringLiteral("ANNUAL"); }

    QString operator()(const NthWeekdayOfMonth &rule) const
    {
        return QStringLiteral("NTH-WEEKDAY;MONTH=%1;WEEKDAY=%2;N=%3;OFFSET=%4")
            .arg(rule.month)
            .arg(weekdayCode(rule.weekday))
            .arg(rule.n)
            .arg(rule.dayOffset);
    }

    QString operator()(const LastWeekdayOfMonth &rule) const
    {
        return QStringLiteral("LAST-WEEKDAY;MONTH=%1;WEEKDAY=%2;OFFSET=%3")
            .arg(rule.month)
            .arg(weekdayCode(rule.weekday))
            .arg(rule.dayOffset);
    }

    QString operator()(const EasterOffset &rule) const
    {
        return QStringLiteral("EASTER;OFFSET=%1").arg(rule.dayOffset);
    }
};

std::optional<int> parseInt(const QHash<QString, QString> &parameters, const QString &key)
{
    if (!parameters.contains(key)) {
        return std::nullopt;
    }
    bool ok = false;
    const int value = parameters.value(key).toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

bool isTrue(const QString &value)
{
    return value.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
}
} // namespace

HolidayCatalogStorage::HolidayCatalogStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &HolidayCatalogStorage::filePath() const
{
    return m_filePath;
}

const std::vector<HolidayDefinition> &HolidayCatalogStorage::definitions() const
{
    return m_definitions;
}

bool HolidayCatalogStorage::addOrUpdateDefinition(HolidayDefinition definition)
{
    if (definition.name.isEmpty()) {
        return false;
    }
    auto it = std::find_if(m_definitions.begin(), m_definitions.end(), [&definition](const HolidayDefinition &existing) {
        return existing.name == definition.name;
    });
    if (it != m_definitions.end()) {
        *it = std::move(definition);
    } else {
        m_definitions.push_back(std::move(definition));
    }
    return save();
}

bool HolidayCatalogStorage::removeDefinition(const QString &name)
{
    auto it = std::find_if(m_definitions.begin(), m_definitions.end(), [&name](const HolidayDefinition &existing) {
        return existing.name == name;
    });
    if (it == m_definitions.end()) {
        return false;
    }
    m_definitions.erase(it);
    return save();
}

bool HolidayCatalogStorage::replaceAll(std::vector<HolidayDefinition> definitions)
{
    m_definitions.clear();
    m_definitions.reserve(definitions.size());
    for (auto &definition : definitions) {
        const bool known = std::any_of(m_definitions.cbegin(), m_definitions.cend(),
                                       [&definition](const HolidayDefinition &existing) {
                                           return existing.name == definition.name;
                                       });
        if (definition.name.isEmpty() || known) {
            continue;
        }
        m_definitions.push_back(std::move(definition));
    }
    return save();
}

QString HolidayCatalogStorage::formatRule(const RecurrenceRule &rule)
{
    return std::visit(RuleFormatter{}, rule);
}

std::optional<RecurrenceRule> HolidayCatalogStorage::parseRule(const QString &value)
{
    const QStringList parts = value.trimmed().split(';', Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        return std::nullopt;
    }

    const QString kind = parts.front().trimmed().toUpper();
    QHash<QString, QString> parameters;
    for (int i = 1; i < parts.size(); ++i) {
        const QString &part = parts.at(i);
        const int equalsIndex = part.indexOf('=');
        if (equalsIndex <= 0) {
            return std::nullopt;
        }
        parameters.insert(part.left(equalsIndex).trimmed().toUpper(), part.mid(equalsIndex + 1).trimmed());
    }

    int offset = 0;
    if (parameters.contains(QStringLiteral("OFFSET"))) {
        const auto parsed = parseInt(parameters, QStringLiteral("OFFSET"));
        if (!parsed) {
            return std::nullopt;
        }
        offset = *parsed;
    }

    if (kind == QLatin1String("ANNUAL")) {
        return RecurrenceRule{AnnualDate{}};
    }
    if (kind == QLatin1String("EASTER")) {
        return RecurrenceRule{EasterOffset{offset}};
    }

    const auto month = parseInt(parameters, QStringLiteral("MONTH"));
    const auto weekday = weekdayFromCode(parameters.value(QStringLiteral("WEEKDAY")));
    if (!month || *month < 1 || *month > 12 || !weekday) {
        return std::nullopt;
    }

    if (kind == QLatin1String("NTH-WEEKDAY")) {
        const auto n = parseInt(parameters, QStringLiteral("N"));
        if (!n || *n < 1 || *n > 5) {
            return std::nullopt;
        }
        return RecurrenceRule{NthWeekdayOfMonth{*month, *weekday, *n, offset}};
    }
    if (kind == QLatin1String("LAST-WEEKDAY")) {
        return RecurrenceRule{LastWeekdayOfMonth{*month, *weekday, offset}};
    }
    return std::nullopt;
}

void HolidayCatalogStorage::load()
{
    m_definitions.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcData) << "Cannot open holiday catalog" << m_filePath << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    bool inHoliday = false;
    bool ruleValid = true;
    HolidayDefinition current;

    auto finalizeHoliday = [&]() {
        if (current.name.isEmpty()) {
            qCWarning(lcData) << "Skipping holiday without a name in" << m_filePath;
            return;
        }
        if (!ruleValid) {
            qCWarning(lcData) << "Skipping holiday" << current.name << "with an unreadable rule";
            return;
        }
        const bool needsDate = !current.isRecurring || std::holds_alternative<AnnualDate>(current.rule);
        if (needsDate && !current.referenceDate.isValid()) {
            qCWarning(lcData) << "Skipping holiday" << current.name << "without a valid date";
            return;
        }
        const bool duplicate = std::any_of(m_definitions.cbegin(), m_definitions.cend(),
                                           [&current](const HolidayDefinition &existing) {
                                               return existing.name == current.name;
                                           });
        if (duplicate) {
            qCWarning(lcData) << "Skipping duplicate holiday" << current.name;
            return;
        }
        m_definitions.push_back(current);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VHOLIDAY")) {
            inHoliday = true;
            ruleValid = true;
            current = HolidayDefinition{};
            return;
        }
        if (line == QLatin1String("END:VHOLIDAY")) {
            if (inHoliday) {
                finalizeHoliday();
            }
            inHoliday = false;
            return;
        }
        if (!inHoliday) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString value = decodeText(rawValue);

        if (name == QLatin1String("NAME")) {
            current.name = value.trimmed();
        } else if (name == QLatin1String("CATEGORY")) {
            current.category = categoryFromKey(value.trimmed()).value_or(HolidayCategory::Other);
        } else if (name == QLatin1String("RECURRING")) {
            current.isRecurring = isTrue(rawValue.trimmed());
        } else if (name == QLatin1String("DATE")) {
            current.referenceDate = QDate::fromString(rawValue.trimmed(), DATE_FORMAT);
        } else if (name == QLatin1String("RULE")) {
            const auto rule = parseRule(rawValue);
            ruleValid = rule.has_value();
            if (rule) {
                current.rule = *rule;
            }
        } else if (name == QLatin1String("EMOJI")) {
            current.emoji = value;
        } else if (name == QLatin1String("DESCRIPTION")) {
            current.description = value;
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }
}

bool HolidayCatalogStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcData) << "Cannot write holiday catalog" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Almanac//Holidays//EN\n";

    for (const HolidayDefinition &definition : m_definitions) {
        stream << "BEGIN:VHOLIDAY\n";
        stream << "NAME:" << encodeText(definition.name) << '\n';
        stream << "CATEGORY:" << categoryKey(definition.category) << '\n';
        stream << "RECURRING:" << (definition.isRecurring ? "TRUE" : "FALSE") << '\n';
        if (definition.referenceDate.isValid()) {
            stream << "DATE:" << definition.referenceDate.toString(DATE_FORMAT) << '\n';
        }
        if (definition.isRecurring) {
            stream << "RULE:" << formatRule(definition.rule) << '\n';
        }
        if (!definition.emoji.isEmpty()) {
            stream << "EMOJI:" << encodeText(definition.emoji) << '\n';
        }
        if (!definition.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(definition.description) << '\n';
        }
        stream << "END:VHOLIDAY\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcData) << "Cannot commit holiday catalog" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

QString HolidayCatalogStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString HolidayCatalogStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != QLatin1Char('\\') || i + 1 >= text.size()) {
            decoded.append(c);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded.append(QLatin1Char('\n'));
        } else if (next == QLatin1Char(',') || next == QLatin1Char(';') || next == QLatin1Char('\\')) {
            decoded.append(next);
        } else {
            decoded.append(c);
            decoded.append(next);
        }
    }
    return decoded;
}

} // namespace data
} // namespace almanac
