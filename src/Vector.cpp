#include"Vector.hpp"

namespace canoclass {

    void AttributeTable::addStringField(const std::string& name, size_t width)
    {
        std::vector<Variant> values = std::vector<Variant>(_nrow, Variant(FixedWidthString()));
        Field newField{ FieldType::String, width, std::move(values) };
        _fields.emplace(name, std::move(newField));
        _fieldNamesInOrder.push_back(name);
    }
    void AttributeTable::addIntegerField(const std::string& name)
    {
        std::vector<Variant> values = std::vector<Variant>(_nrow, Variant((int64_t)0));
        Field newField{ FieldType::Integer, 0, std::move(values) };
        _fields.emplace(name, std::move(newField));
        _fieldNamesInOrder.push_back(name);
    }
    void AttributeTable::addRealField(const std::string& name)
    {
        std::vector<Variant> values = std::vector<Variant>(_nrow, Variant((double)0));
        Field newField{ FieldType::Real, 0, std::move(values) };
        _fields.emplace(name, std::move(newField));
        _fieldNamesInOrder.push_back(name);
    }

    bool AttributeTable::fieldExists(const std::string& name) const
    {
        return _fields.contains(name);
    }

    void AttributeTable::resize(size_t nrow) {
        _nrow = nrow;
        for (auto& keyValue : _fields) {
            switch (keyValue.second.type) {
            case FieldType::Integer:
                keyValue.second.values.resize(_nrow, Variant((int64_t)0));
                break;
            case FieldType::Real:
                keyValue.second.values.resize(_nrow, Variant((double)0.));
                break;
            case FieldType::String:
                keyValue.second.values.resize(_nrow, Variant(FixedWidthString()));
                break;
            }
        }
    }
    void AttributeTable::addRow()
    {
        resize(_nrow + 1);
    }

    size_t AttributeTable::nFeature() const
    {
        return _nrow;
    }

    const std::vector<std::string>& AttributeTable::getAllFieldNames() const
    {
        return _fieldNamesInOrder;
    }
    FieldType AttributeTable::getFieldType(const std::string& name) const
    {
        return _getField(name).type;
    }
    size_t AttributeTable::getStringFieldWidth(const std::string& name) const
    {
        if (_getField(name).type != FieldType::String) {
            throw WrongFieldTypeException("Wrong field type; expected string");
        }
        return _getField(name).width;
    }

    const std::string& AttributeTable::getStringField(size_t index, const std::string& name) const
    {
        if (_getField(name).type != FieldType::String) {
            throw WrongFieldTypeException("Wrong field type; expected string");
        }
        return std::get<FixedWidthString>(_getField(name).values.at(index)).get();
    }
    int64_t AttributeTable::getIntegerField(size_t index, const std::string& name) const
    {
        if (_getField(name).type != FieldType::Integer) {
            throw WrongFieldTypeException("Wrong field type; expected integer");
        }
        return std::get<int64_t>(_getField(name).values.at(index));
    }
    double AttributeTable::getRealField(size_t index, const std::string& name) const
    {
        if (_getField(name).type != FieldType::Real) {
            throw WrongFieldTypeException("Wrong field type; expected real");
        }
        return std::get<double>(_getField(name).values.at(index));
    }

    void AttributeTable::setStringField(size_t index, const std::string& name, const std::string& value)
    {
        Field& field = _getField(name);
        if (field.type != FieldType::String) {
            throw WrongFieldTypeException("Wrong field type; expected string");
        }
        FixedWidthString& fws = std::get<FixedWidthString>(field.values.at(index));
        fws.set(value, field.width);
    }
    void AttributeTable::setIntegerField(size_t index, const std::string& name, int64_t value)
    {
        Field& field = _getField(name);
        if (field.type != FieldType::Integer) {
            throw WrongFieldTypeException("Wrong field type; expected integer");
        }
        field.values.at(index) = value;
    }
    void AttributeTable::setRealField(size_t index, const std::string& name, double value)
    {
        Field& field = _getField(name);
        if (field.type != FieldType::Real) {
            throw WrongFieldTypeException("Wrong field type; expected real");
        }
        field.values.at(index) = value;
    }

    const AttributeTable::Field& AttributeTable::_getField(const std::string& name) const
    {
        auto it = _fields.find(name);
        if (it == _fields.end()) {
            throw UnsupportedFormatException("Field not found: " + name);
        }
        return it->second;
    }
    AttributeTable::Field& AttributeTable::_getField(const std::string& name)
    {
        auto it = _fields.find(name);
        if (it == _fields.end()) {
            throw UnsupportedFormatException("Field not found: " + name);
        }
        return it->second;
    }

    //unlike a dbf field, the stored value isn't padded, so comparisons with std::string work
    void AttributeTable::FixedWidthString::set(const std::string& value, size_t width)
    {
        if (value.size() > width) {
            _data = value.substr(0, width);
        }
        else {
            _data = value;
        }
    }
    const std::string& AttributeTable::FixedWidthString::get() const
    {
        return _data;
    }

}
