/*-------------------------------------------------------------------------
 *
 * CValue.hpp
 *      Typed document value model for StrataDB.
 *
 *      A CValue is a closed tagged union over the wire scalar kinds plus
 *      the two composite kinds CDocument and CArray. Composite values own
 *      their children; copying a value copies the whole subtree.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace StrataDB
{

using std::string;
using std::vector;

/* Element type tags, numbered as on the wire */
enum class CValueType : uint8_t
{
    Double = 0x01,
    String = 0x02,
    Document = 0x03,
    Array = 0x04,
    Binary = 0x05,
    ObjectId = 0x07,
    Boolean = 0x08,
    DateTime = 0x09,
    Null = 0x0A,
    Regex = 0x0B,
    Int32 = 0x10,
    Timestamp = 0x11,
    Int64 = 0x12,
    Decimal128 = 0x13
};

struct CNull
{
    bool operator==(const CNull&) const = default;
};

struct CBinary
{
    uint8_t subtype = 0;
    vector<uint8_t> data;

    bool operator==(const CBinary&) const = default;
};

struct CObjectId
{
    std::array<uint8_t, 12> bytes{};

    static CObjectId generate();
    static bool fromHex(const string& hex, CObjectId& out);
    string toHex() const;

    bool operator==(const CObjectId&) const = default;
};

/* Milliseconds since the Unix epoch, UTC */
struct CDateTime
{
    int64_t millis = 0;

    bool operator==(const CDateTime&) const = default;
};

struct CRegex
{
    string pattern;
    string options;

    bool operator==(const CRegex&) const = default;
};

struct CTimestamp
{
    uint32_t seconds = 0;
    uint32_t increment = 0;

    uint64_t value() const noexcept
    {
        return (static_cast<uint64_t>(seconds) << 32) | increment;
    }

    bool operator==(const CTimestamp&) const = default;
};

/* IEEE 754-2008 decimal128, stored in the wire bit layout */
struct CDecimal128
{
    uint64_t high = 0;
    uint64_t low = 0;

    static bool fromString(const string& text, CDecimal128& out);
    string toString() const;
    double toDouble() const;

    bool operator==(const CDecimal128&) const = default;
};

class CValue;
struct CField;

class CArray
{
  public:
    CArray() = default;
    CArray(std::initializer_list<CValue> values);

    size_t size() const noexcept;
    bool empty() const noexcept;

    const CValue& at(size_t index) const;
    CValue& at(size_t index);

    void push_back(CValue value);
    void resize(size_t count);
    void erase(size_t index);

    const vector<CValue>& values() const noexcept
    {
        return values_;
    }
    vector<CValue>& values() noexcept
    {
        return values_;
    }

  private:
    vector<CValue> values_;
};

/*
 * CDocument
 *		Ordered sequence of (key, value) pairs. Duplicate keys can be
 *		represented so that decoded input can be validated; set() keeps
 *		keys unique, append() does not.
 */
class CDocument
{
  public:
    CDocument() = default;
    CDocument(std::initializer_list<CField> fields);

    size_t size() const noexcept;
    bool empty() const noexcept;

    bool has(const string& key) const;
    const CValue* get(const string& key) const;
    CValue* get(const string& key);

    void set(const string& key, CValue value);
    void append(const string& key, CValue value);
    void prepend(const string& key, CValue value);
    bool remove(const string& key);

    vector<string> keys() const;
    const string& firstKey() const;

    const vector<CField>& fields() const noexcept
    {
        return fields_;
    }
    vector<CField>& fields() noexcept
    {
        return fields_;
    }

  private:
    vector<CField> fields_;
};

class CValue
{
  public:
    using Storage =
        std::variant<CNull, double, string, CDocument, CArray, CBinary,
                     CObjectId, bool, CDateTime, CRegex, int32_t, CTimestamp,
                     int64_t, CDecimal128>;

    CValue() : data_(CNull{})
    {
    }
    CValue(CNull v) : data_(v)
    {
    }
    CValue(double v) : data_(v)
    {
    }
    CValue(int32_t v) : data_(v)
    {
    }
    CValue(int64_t v) : data_(v)
    {
    }
    CValue(bool v) : data_(v)
    {
    }
    CValue(const char* v) : data_(string(v))
    {
    }
    CValue(string v) : data_(std::move(v))
    {
    }
    CValue(CDocument v) : data_(std::move(v))
    {
    }
    CValue(CArray v) : data_(std::move(v))
    {
    }
    CValue(CBinary v) : data_(std::move(v))
    {
    }
    CValue(CObjectId v) : data_(v)
    {
    }
    CValue(CDateTime v) : data_(v)
    {
    }
    CValue(CRegex v) : data_(std::move(v))
    {
    }
    CValue(CTimestamp v) : data_(v)
    {
    }
    CValue(CDecimal128 v) : data_(v)
    {
    }

    CValueType type() const noexcept;

    template <typename T> bool is() const noexcept
    {
        return std::holds_alternative<T>(data_);
    }

    template <typename T> const T& as() const
    {
        return std::get<T>(data_);
    }

    template <typename T> T& as()
    {
        return std::get<T>(data_);
    }

    bool isNull() const noexcept
    {
        return is<CNull>();
    }
    bool isDocument() const noexcept
    {
        return is<CDocument>();
    }
    bool isArray() const noexcept
    {
        return is<CArray>();
    }
    bool isString() const noexcept
    {
        return is<string>();
    }

    /* double, int32, int64 or decimal128 */
    bool isNumber() const noexcept;

    /* Numeric value as double; 0 for non-numeric kinds */
    double toDouble() const;

    bool isNaN() const;

    const Storage& storage() const noexcept
    {
        return data_;
    }

  private:
    Storage data_;
};

struct CField
{
    string key;
    CValue value;
};

} // namespace StrataDB
