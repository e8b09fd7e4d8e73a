/*-------------------------------------------------------------------------
 *
 * CQueryMatcher.cpp
 *      Query filter compilation and evaluation.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "query/CQueryMatcher.hpp"

#include "document/CPath.hpp"
#include "document/CValueCompare.hpp"
#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <pcrecpp.h>

#include <cmath>
#include <limits>
#include <utility>

namespace StrataDB
{

namespace
{

using CValues = vector<const CValue*>;

/* $type code that stands for every numeric kind */
constexpr int kNumberTypeCode = 0;

const CValue&
nullValue()
{
    static const CValue value;
    return value;
}

/* A missing field compares as null for most operators */
CValues
orNull(const CValues& values)
{
    if (values.empty())
        return CValues{&nullValue()};
    return values;
}

/* Candidates plus the elements of every candidate array */
CValues
expand(const CValues& values)
{
    CValues result;

    for (const CValue* value : values)
    {
        result.push_back(value);
        if (value->isArray())
        {
            for (const auto& element : value->as<CArray>().values())
                result.push_back(&element);
        }
    }
    return result;
}

void
collectFrom(const CValue& value, const vector<string>& segments, size_t pos,
            CValues& out)
{
    if (pos == segments.size())
    {
        out.push_back(&value);
        return;
    }

    const string& segment = segments[pos];

    if (value.isDocument())
    {
        const CValue* child = value.as<CDocument>().get(segment);

        if (child)
            collectFrom(*child, segments, pos + 1, out);
    }
    else if (value.isArray())
    {
        const auto& arr = value.as<CArray>();
        auto index = CPath::arrayIndex(segment);

        if (index && *index < arr.size())
            collectFrom(arr.at(*index), segments, pos + 1, out);
        for (const auto& element : arr.values())
        {
            if (element.isDocument())
                collectFrom(element, segments, pos, out);
        }
    }
}

/*
 * CRegexMatcher
 *		Compiled pattern plus the literal it came from. Options are checked
 *		before the pattern is compiled.
 */
class CRegexMatcher
{
  public:
    explicit CRegexMatcher(const CRegex& regex) : regex_(regex)
    {
        pcrecpp::RE_Options options;

        options.set_utf8(true);
        for (char flag : regex.options)
        {
            switch (flag)
            {
            case 'i':
                options.set_caseless(true);
                break;
            case 'm':
                options.set_multiline(true);
                break;
            case 's':
                options.set_dotall(true);
                break;
            case 'x':
                options.set_extended(true);
                break;
            default:
                throw CCommandError(CErrorCode::Location51108,
                                    CErrorMessages::invalidRegexFlag(flag));
            }
        }

        re_ = std::make_shared<pcrecpp::RE>(regex.pattern, options);
        if (!re_->error().empty())
            throw CCommandError(CErrorCode::Location51091,
                                CErrorMessages::invalidRegex(re_->error()));
    }

    bool matches(const CValue& value) const
    {
        if (value.isString())
            return re_->PartialMatch(value.as<string>());
        if (value.is<CRegex>())
            return value.as<CRegex>() == regex_;
        return false;
    }

  private:
    CRegex regex_;
    std::shared_ptr<pcrecpp::RE> re_;
};

class IFieldPredicate
{
  public:
    virtual ~IFieldPredicate() = default;

    /* values is empty when the path does not exist in the document */
    virtual bool test(const CValues& values) const = 0;
};

using CPredicates = vector<std::unique_ptr<IFieldPredicate>>;

bool
testAll(const CPredicates& predicates, const CValues& values)
{
    for (const auto& predicate : predicates)
    {
        if (!predicate->test(values))
            return false;
    }
    return true;
}

class CEqualPredicate : public IFieldPredicate
{
  public:
    explicit CEqualPredicate(CValue expected) : expected_(std::move(expected))
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : expand(orNull(values)))
        {
            if (valuesEqual(*value, expected_))
                return true;
        }
        return false;
    }

  private:
    CValue expected_;
};

class CRegexPredicate : public IFieldPredicate
{
  public:
    explicit CRegexPredicate(CRegexMatcher matcher)
        : matcher_(std::move(matcher))
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : expand(values))
        {
            if (matcher_.matches(*value))
                return true;
        }
        return false;
    }

  private:
    CRegexMatcher matcher_;
};

enum class CCompareOp
{
    Gt,
    Gte,
    Lt,
    Lte
};

/*
 * CComparePredicate
 *		Ordering operators only compare values of the same type bracket.
 *		NaN is only ever equal to NaN.
 */
class CComparePredicate : public IFieldPredicate
{
  public:
    CComparePredicate(CCompareOp op, CValue bound)
        : op_(op), bound_(std::move(bound))
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : expand(orNull(values)))
        {
            if (typeOrder(*value) != typeOrder(bound_))
                continue;
            if (value->isNaN() || bound_.isNaN())
            {
                if (value->isNaN() && bound_.isNaN() &&
                    (op_ == CCompareOp::Gte || op_ == CCompareOp::Lte))
                    return true;
                continue;
            }

            int cmp = compareValues(*value, bound_);

            switch (op_)
            {
            case CCompareOp::Gt:
                if (cmp > 0)
                    return true;
                break;
            case CCompareOp::Gte:
                if (cmp >= 0)
                    return true;
                break;
            case CCompareOp::Lt:
                if (cmp < 0)
                    return true;
                break;
            case CCompareOp::Lte:
                if (cmp <= 0)
                    return true;
                break;
            }
        }
        return false;
    }

  private:
    CCompareOp op_;
    CValue bound_;
};

class CInPredicate : public IFieldPredicate
{
  public:
    CInPredicate(vector<CValue> values, vector<CRegexMatcher> regexes)
        : values_(std::move(values)), regexes_(std::move(regexes))
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : expand(orNull(values)))
        {
            for (const auto& candidate : values_)
            {
                if (valuesEqual(*value, candidate))
                    return true;
            }
            for (const auto& regex : regexes_)
            {
                if (regex.matches(*value))
                    return true;
            }
        }
        return false;
    }

  private:
    vector<CValue> values_;
    vector<CRegexMatcher> regexes_;
};

class CNotPredicate : public IFieldPredicate
{
  public:
    explicit CNotPredicate(CPredicates children)
        : children_(std::move(children))
    {
    }

    bool test(const CValues& values) const override
    {
        return !testAll(children_, values);
    }

  private:
    CPredicates children_;
};

class CExistsPredicate : public IFieldPredicate
{
  public:
    explicit CExistsPredicate(bool wanted) : wanted_(wanted)
    {
    }

    bool test(const CValues& values) const override
    {
        return values.empty() != wanted_;
    }

  private:
    bool wanted_;
};

class CTypePredicate : public IFieldPredicate
{
  public:
    explicit CTypePredicate(vector<int> codes) : codes_(std::move(codes))
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : expand(values))
        {
            for (int code : codes_)
            {
                if (code == kNumberTypeCode ? value->isNumber()
                                            : static_cast<int>(value->type()) ==
                                                  code)
                    return true;
            }
        }
        return false;
    }

  private:
    vector<int> codes_;
};

class CSizePredicate : public IFieldPredicate
{
  public:
    explicit CSizePredicate(size_t size) : size_(size)
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : values)
        {
            if (value->isArray() && value->as<CArray>().size() == size_)
                return true;
        }
        return false;
    }

  private:
    size_t size_;
};

/* Every listed value must be present; scalars must equal each of them */
class CAllPredicate : public IFieldPredicate
{
  public:
    explicit CAllPredicate(vector<CValue> items) : items_(std::move(items))
    {
    }

    bool test(const CValues& values) const override
    {
        if (items_.empty())
            return false;
        for (const auto& item : items_)
        {
            if (!CEqualPredicate(item).test(values))
                return false;
        }
        return true;
    }

  private:
    vector<CValue> items_;
};

class CElemMatchPredicate : public IFieldPredicate
{
  public:
    explicit CElemMatchPredicate(CPredicates predicates)
        : predicates_(std::move(predicates))
    {
    }

    explicit CElemMatchPredicate(std::unique_ptr<IMatchExpression> expression)
        : expression_(std::move(expression))
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : values)
        {
            if (!value->isArray())
                continue;
            for (const auto& element : value->as<CArray>().values())
            {
                if (expression_)
                {
                    if (element.isDocument() &&
                        expression_->matches(element.as<CDocument>()))
                        return true;
                }
                else if (testAll(predicates_, CValues{&element}))
                    return true;
            }
        }
        return false;
    }

  private:
    CPredicates predicates_;
    std::unique_ptr<IMatchExpression> expression_;
};

class CModPredicate : public IFieldPredicate
{
  public:
    CModPredicate(int64_t divisor, int64_t remainder)
        : divisor_(divisor), remainder_(remainder)
    {
    }

    bool test(const CValues& values) const override
    {
        for (const CValue* value : expand(values))
        {
            int64_t field = 0;

            if (value->is<int32_t>())
                field = value->as<int32_t>();
            else if (value->is<int64_t>())
                field = value->as<int64_t>();
            else if (value->isNumber())
            {
                double d = std::trunc(value->toDouble());

                if (!std::isfinite(d) ||
                    d >= static_cast<double>(
                             std::numeric_limits<int64_t>::max()) ||
                    d < static_cast<double>(
                            std::numeric_limits<int64_t>::min()))
                    continue;
                field = static_cast<int64_t>(d);
            }
            else
                continue;

            int64_t result = divisor_ == -1 ? 0 : field % divisor_;

            if (result == remainder_)
                return true;
        }
        return false;
    }

  private:
    int64_t divisor_;
    int64_t remainder_;
};

class CFieldExpression : public IMatchExpression
{
  public:
    CFieldExpression(string path, CPredicates predicates)
        : path_(std::move(path)), predicates_(std::move(predicates))
    {
    }

    bool matches(const CDocument& doc) const override
    {
        return testAll(predicates_, CQueryMatcher::collect(doc, path_));
    }

  private:
    string path_;
    CPredicates predicates_;
};

enum class CLogicalOp
{
    And,
    Or,
    Nor
};

class CLogicalExpression : public IMatchExpression
{
  public:
    CLogicalExpression(CLogicalOp op,
                       vector<std::unique_ptr<IMatchExpression>> children)
        : op_(op), children_(std::move(children))
    {
    }

    bool matches(const CDocument& doc) const override
    {
        switch (op_)
        {
        case CLogicalOp::And:
            for (const auto& child : children_)
            {
                if (!child->matches(doc))
                    return false;
            }
            return true;
        case CLogicalOp::Or:
            for (const auto& child : children_)
            {
                if (child->matches(doc))
                    return true;
            }
            return false;
        case CLogicalOp::Nor:
            for (const auto& child : children_)
            {
                if (child->matches(doc))
                    return false;
            }
            return true;
        }
        return false;
    }

  private:
    CLogicalOp op_;
    vector<std::unique_ptr<IMatchExpression>> children_;
};

std::unique_ptr<IMatchExpression> compileFilter(const CDocument& filter);
void compileOperators(const string& path, const CDocument& ops,
                      CPredicates& out);

bool
isOperatorDocument(const CValue& value)
{
    if (!value.isDocument() || value.as<CDocument>().empty())
        return false;

    const string& first = value.as<CDocument>().firstKey();

    return !first.empty() && first.front() == '$';
}

bool
truthy(const CValue& value)
{
    if (value.is<bool>())
        return value.as<bool>();
    if (value.isNumber())
        return value.toDouble() != 0.0;
    return !value.isNull();
}

int
parseTypeCode(const CValue& arg)
{
    static const std::pair<const char*, int> aliases[] = {
        {"double", 1},    {"string", 2},     {"object", 3},
        {"array", 4},     {"binData", 5},    {"objectId", 7},
        {"bool", 8},      {"date", 9},       {"null", 10},
        {"regex", 11},    {"int", 16},       {"timestamp", 17},
        {"long", 18},     {"decimal", 19},   {"number", kNumberTypeCode}};

    if (arg.isString())
    {
        for (const auto& alias : aliases)
        {
            if (arg.as<string>() == alias.first)
                return alias.second;
        }
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::unknownTypeAlias(arg.as<string>()));
    }
    if (!arg.isNumber())
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::typeNeedsStringOrNumber(arg));

    double d = arg.toDouble();

    if (!std::isfinite(d) || std::trunc(d) != d)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::invalidTypeCode(arg));

    int code = static_cast<int>(d);

    for (const auto& alias : aliases)
    {
        if (alias.second == code && code != kNumberTypeCode)
            return code;
    }
    throw CCommandError(CErrorCode::BadValue,
                        CErrorMessages::invalidTypeCode(arg));
}

size_t
parseSize(const CValue& arg)
{
    int64_t size = 0;

    if (arg.is<int32_t>())
        size = arg.as<int32_t>();
    else if (arg.is<int64_t>())
        size = arg.as<int64_t>();
    else if (arg.isNumber())
    {
        double d = arg.toDouble();

        if (!std::isfinite(d) || std::trunc(d) != d)
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::sizeNotInteger(arg));
        size = static_cast<int64_t>(d);
    }
    else
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::sizeNotNumber(arg));

    if (size < 0)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::sizeNegative(arg));
    return static_cast<size_t>(size);
}

/* Integral operand of $mod; false when the value is not a usable number */
bool
modOperand(const CValue& value, int64_t& out)
{
    if (value.is<int32_t>())
        out = value.as<int32_t>();
    else if (value.is<int64_t>())
        out = value.as<int64_t>();
    else if (value.is<double>())
    {
        double d = std::trunc(value.as<double>());

        if (!std::isfinite(d) ||
            d >= static_cast<double>(std::numeric_limits<int64_t>::max()) ||
            d < static_cast<double>(std::numeric_limits<int64_t>::min()))
            return false;
        out = static_cast<int64_t>(d);
    }
    else
        return false;
    return true;
}

std::unique_ptr<IFieldPredicate>
compileMod(const CValue& arg)
{
    int64_t divisor = 0;
    int64_t remainder = 0;

    if (!arg.isArray())
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::modNeedsArray());

    const auto& arr = arg.as<CArray>();

    if (arr.size() < 2)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::modNotEnoughElements());
    if (arr.size() > 2)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::modTooManyElements());
    if (!modOperand(arr.at(0), divisor))
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::modDivisorNotNumber());
    if (!modOperand(arr.at(1), remainder))
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::modRemainderNotNumber());
    if (divisor == 0)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::modDivisorZero());
    return std::make_unique<CModPredicate>(divisor, remainder);
}

std::unique_ptr<IFieldPredicate>
compileIn(const string& op, const CValue& arg)
{
    vector<CValue> values;
    vector<CRegexMatcher> regexes;

    if (!arg.isArray())
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::needsArray(op));

    for (const auto& element : arg.as<CArray>().values())
    {
        if (element.isDocument())
        {
            for (const auto& field : element.as<CDocument>().fields())
            {
                if (!field.key.empty() && field.key.front() == '$')
                    throw CCommandError(
                        CErrorCode::BadValue,
                        CErrorMessages::cannotNestDollarUnderIn());
            }
        }
        if (element.is<CRegex>())
            regexes.emplace_back(element.as<CRegex>());
        else
            values.push_back(element);
    }

    auto in = std::make_unique<CInPredicate>(std::move(values),
                                             std::move(regexes));

    if (op == "$in")
        return in;

    CPredicates negated;

    negated.push_back(std::move(in));
    return std::make_unique<CNotPredicate>(std::move(negated));
}

/*
 * regexFromOperator
 *		Combine $regex with a sibling $options. Options may be given in
 *		one place only.
 */
CRegex
regexFromOperator(const CValue& arg, const CDocument& ops)
{
    string options;
    const CValue* optionsValue = ops.get("$options");

    if (optionsValue)
    {
        if (!optionsValue->isString())
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::optionsNotString());
        options = optionsValue->as<string>();
    }

    if (arg.isString())
        return CRegex{arg.as<string>(), options};
    if (arg.is<CRegex>())
    {
        CRegex regex = arg.as<CRegex>();

        if (!options.empty())
        {
            if (!regex.options.empty())
                throw CCommandError(CErrorCode::Location51075,
                                    CErrorMessages::regexOptionsTwice());
            regex.options = options;
        }
        return regex;
    }
    throw CCommandError(CErrorCode::BadValue, CErrorMessages::regexNotString());
}

std::unique_ptr<IFieldPredicate>
compileElemMatch(const string& path, const CValue& arg)
{
    if (!arg.isDocument())
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::elemMatchNeedsObject());

    const auto& sub = arg.as<CDocument>();
    const string& first = sub.firstKey();
    bool logical = first == "$and" || first == "$or" || first == "$nor";

    if (isOperatorDocument(arg) && !logical)
    {
        CPredicates predicates;

        compileOperators(path, sub, predicates);
        return std::make_unique<CElemMatchPredicate>(std::move(predicates));
    }
    return std::make_unique<CElemMatchPredicate>(compileFilter(sub));
}

std::unique_ptr<IFieldPredicate>
compileOperator(const string& path, const string& op, const CValue& arg,
                const CDocument& ops)
{
    if (op == "$eq")
        return std::make_unique<CEqualPredicate>(arg);

    if (op == "$ne")
    {
        CPredicates negated;

        if (arg.is<CRegex>())
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::regexAsNe());
        negated.push_back(std::make_unique<CEqualPredicate>(arg));
        return std::make_unique<CNotPredicate>(std::move(negated));
    }

    if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte")
    {
        CCompareOp cmp = op == "$gt"    ? CCompareOp::Gt
                         : op == "$gte" ? CCompareOp::Gte
                         : op == "$lt"  ? CCompareOp::Lt
                                        : CCompareOp::Lte;

        if (arg.is<CRegex>())
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::regexAsPredicate(path));
        return std::make_unique<CComparePredicate>(cmp, arg);
    }

    if (op == "$in" || op == "$nin")
        return compileIn(op, arg);

    if (op == "$not")
    {
        CPredicates children;

        if (arg.isDocument())
            compileOperators(path, arg.as<CDocument>(), children);
        else if (arg.is<CRegex>())
            children.push_back(std::make_unique<CRegexPredicate>(
                CRegexMatcher(regexFromOperator(arg, ops))));
        else
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::notNeedsRegexOrDocument());
        return std::make_unique<CNotPredicate>(std::move(children));
    }

    if (op == "$regex")
        return std::make_unique<CRegexPredicate>(
            CRegexMatcher(regexFromOperator(arg, ops)));

    if (op == "$elemMatch")
        return compileElemMatch(path, arg);

    if (op == "$size")
        return std::make_unique<CSizePredicate>(parseSize(arg));

    if (op == "$all")
    {
        if (!arg.isArray())
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::needsArray(op));
        return std::make_unique<CAllPredicate>(arg.as<CArray>().values());
    }

    if (op == "$exists")
        return std::make_unique<CExistsPredicate>(truthy(arg));

    if (op == "$type")
    {
        vector<int> codes;

        if (arg.isArray())
        {
            for (const auto& element : arg.as<CArray>().values())
                codes.push_back(parseTypeCode(element));
        }
        else
            codes.push_back(parseTypeCode(arg));
        return std::make_unique<CTypePredicate>(std::move(codes));
    }

    if (op == "$mod")
        return compileMod(arg);

    throw CCommandError(CErrorCode::BadValue,
                        CErrorMessages::unknownOperator(op));
}

void
compileOperators(const string& path, const CDocument& ops, CPredicates& out)
{
    if (ops.has("$options") && !ops.has("$regex") && !ops.has("$not"))
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::optionsWithoutRegex());

    for (const auto& field : ops.fields())
    {
        if (field.key == "$options")
            continue;
        if (field.key.empty() || field.key.front() != '$')
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::unknownOperator(field.key));
        out.push_back(compileOperator(path, field.key, field.value, ops));
    }
}

std::unique_ptr<IMatchExpression>
compileLogical(const string& op, const CValue& arg)
{
    vector<std::unique_ptr<IMatchExpression>> children;
    CLogicalOp logical = op == "$and"  ? CLogicalOp::And
                         : op == "$or" ? CLogicalOp::Or
                                       : CLogicalOp::Nor;

    if (!arg.isArray())
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::logicalNeedsArray(op));

    const auto& entries = arg.as<CArray>();

    if (entries.empty())
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::logicalNonEmpty());
    for (const auto& entry : entries.values())
    {
        if (!entry.isDocument())
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::logicalEntriesObjects());
    }
    for (const auto& entry : entries.values())
        children.push_back(compileFilter(entry.as<CDocument>()));
    return std::make_unique<CLogicalExpression>(logical, std::move(children));
}

/*
 * compileFilter
 *		Top-level entries are ANDed together.
 */
std::unique_ptr<IMatchExpression>
compileFilter(const CDocument& filter)
{
    vector<std::unique_ptr<IMatchExpression>> children;

    for (const auto& field : filter.fields())
    {
        const string& key = field.key;
        const CValue& value = field.value;

        if (!key.empty() && key.front() == '$')
        {
            if (key == "$and" || key == "$or" || key == "$nor")
                children.push_back(compileLogical(key, value));
            else if (key != "$comment")
                throw CCommandError(
                    CErrorCode::BadValue,
                    CErrorMessages::unknownTopLevelOperator(key));
            continue;
        }

        CPredicates predicates;

        if (isOperatorDocument(value))
            compileOperators(key, value.as<CDocument>(), predicates);
        else if (value.is<CRegex>())
            predicates.push_back(std::make_unique<CRegexPredicate>(
                CRegexMatcher(value.as<CRegex>())));
        else
            predicates.push_back(std::make_unique<CEqualPredicate>(value));

        children.push_back(
            std::make_unique<CFieldExpression>(key, std::move(predicates)));
    }
    return std::make_unique<CLogicalExpression>(CLogicalOp::And,
                                                std::move(children));
}

} // namespace

CQueryMatcher::CQueryMatcher() : root_(compileFilter(CDocument{}))
{
}

CQueryMatcher::CQueryMatcher(const CDocument& filter)
    : filter_(filter), root_(compileFilter(filter))
{
}

bool
CQueryMatcher::matches(const CDocument& doc) const
{
    return root_->matches(doc);
}

bool
CQueryMatcher::match(const CDocument& doc, const CDocument& filter)
{
    return CQueryMatcher(filter).matches(doc);
}

vector<const CValue*>
CQueryMatcher::collect(const CDocument& doc, const string& path)
{
    CValues out;
    vector<string> segments = CPath::split(path);
    const CValue* first = doc.get(segments.front());

    if (first)
        collectFrom(*first, segments, 1, out);
    return out;
}

} // namespace StrataDB
