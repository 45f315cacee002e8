//----------------------------------------------------------------------------------------------------------------------
// File: PrettyPrinter.hpp
// Description: Indented rendering of JSON documents for the files a person may need to read or edit (e.g. the 
// configuration file and the overlay repository configuration).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JSON {
//----------------------------------------------------------------------------------------------------------------------

class PrettyPrinter;

//----------------------------------------------------------------------------------------------------------------------
} // JSON namespace
//----------------------------------------------------------------------------------------------------------------------

class JSON::PrettyPrinter
{
public:
    static constexpr std::string_view ValueSeparator = ": ";
    static constexpr std::string_view FieldSeparator = ",\n";
    static constexpr std::string_view Newline = "\n";

    static constexpr std::size_t DefaultIndentSize = 4;

    explicit PrettyPrinter(std::size_t indentSize = DefaultIndentSize);

    void Format(boost::json::value const& json, std::ostream& os);
    [[nodiscard]] bool WriteFile(boost::json::value const& json, std::filesystem::path const& path);

private:
    void FormatObject(boost::json::object const& object, std::ostream& os);
    void FormatArray(boost::json::array const& array, std::ostream& os);

    void IncreaseIndent();
    void DecreaseIndent();

    std::string m_indentation;
    std::size_t m_indentSize;
};

//----------------------------------------------------------------------------------------------------------------------

inline JSON::PrettyPrinter::PrettyPrinter(std::size_t indentSize)
    : m_indentation()
    , m_indentSize(indentSize)
{
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::Format(boost::json::value const& json, std::ostream& os)
{
    switch (json.kind()) {
        case boost::json::kind::object: FormatObject(json.get_object(), os); break;
        case boost::json::kind::array: FormatArray(json.get_array(), os); break;
        case boost::json::kind::bool_: os << ((json.get_bool()) ? "true" : "false"); break;
        case boost::json::kind::string: os << boost::json::serialize(json.get_string()); break;
        case boost::json::kind::uint64: os << json.get_uint64(); break;
        case boost::json::kind::int64: os << json.get_int64(); break;
        case boost::json::kind::double_: os << json.get_double(); break;
        case boost::json::kind::null: os << "null"; break;
    }

    if (m_indentation.empty()) { os << Newline; }
}

//----------------------------------------------------------------------------------------------------------------------

inline bool JSON::PrettyPrinter::WriteFile(boost::json::value const& json, std::filesystem::path const& path)
{
    std::ofstream writer(path, std::ios::out | std::ios::trunc);
    if (writer.fail()) { return false; }
    Format(json, writer);
    writer.close();
    return !writer.fail();
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::FormatObject(boost::json::object const& object, std::ostream& os)
{
    // Empty containers are rendered on a single line. 
    if (object.empty()) { os << "{}"; return; }

    os << "{" << Newline;
    IncreaseIndent();
    for (auto itr = object.begin(); itr != object.end(); ++itr) {
        if (itr != object.begin()) { os << FieldSeparator; }
        os << m_indentation << boost::json::serialize(itr->key()) << ValueSeparator;
        Format(itr->value(), os);
    }
    os << Newline;
    DecreaseIndent();
    os << m_indentation << "}";
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::FormatArray(boost::json::array const& array, std::ostream& os)
{
    if (array.empty()) { os << "[]"; return; }

    os << "[" << Newline;
    IncreaseIndent();
    for (auto itr = array.begin(); itr != array.end(); ++itr) {
        if (itr != array.begin()) { os << FieldSeparator; }
        os << m_indentation;
        Format(*itr, os);
    }
    os << Newline;
    DecreaseIndent();
    os << m_indentation << "]";
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::IncreaseIndent() { m_indentation.append(m_indentSize, ' '); }

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::DecreaseIndent() { m_indentation.resize(m_indentation.size() - m_indentSize); }

//----------------------------------------------------------------------------------------------------------------------
