#include <fstream>
#include <stdexcept>

#include "relaysync/storage/persistence.hpp"

using namespace nlohmann;
using namespace relaysync::storage;
using namespace std;

namespace fs = std::filesystem;

#pragma region InMemoryPersistence

optional<string> InMemoryPersistence::get(const string& key)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_values.find(key);
    if (it == this->_values.end())
    {
        return nullopt;
    }

    return it->second;
};

void InMemoryPersistence::set(const string& key, const string& value)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_values[key] = value;
};

#pragma endregion

#pragma region JsonFilePersistence

JsonFilePersistence::JsonFilePersistence(fs::path path)
: _path(move(path)), _document(json::object())
{
    this->_load();
};

optional<string> JsonFilePersistence::get(const string& key)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_document.find(key);
    if (it == this->_document.end() || !it->is_string())
    {
        return nullopt;
    }

    return it->get<string>();
};

void JsonFilePersistence::set(const string& key, const string& value)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_document[key] = value;
    this->_flush();
};

void JsonFilePersistence::_load()
{
    error_code error;
    if (!fs::exists(this->_path, error))
    {
        PLOG_VERBOSE << "Store file " << this->_path << " does not exist yet.";
        return;
    }

    ifstream file(this->_path);
    try
    {
        json document = json::parse(file);
        if (document.is_object())
        {
            this->_document = move(document);
        }
        else
        {
            PLOG_WARNING << "Store file " << this->_path << " does not hold a JSON object; starting empty.";
        }
    }
    catch (const json::exception& je)
    {
        PLOG_WARNING << "Failed to parse store file " << this->_path << ": " << je.what();
    }
};

void JsonFilePersistence::_flush()
{
    fs::path temporaryPath = this->_path;
    temporaryPath += ".tmp";

    if (this->_path.has_parent_path())
    {
        error_code error;
        fs::create_directories(this->_path.parent_path(), error);
    }

    {
        ofstream file(temporaryPath, ios::trunc);
        file << this->_document.dump(2);
        if (!file.good())
        {
            PLOG_ERROR << "Failed to write store file " << temporaryPath;
            throw runtime_error("JsonFilePersistence::set: Failed to write " + temporaryPath.string());
        }
    }

    error_code error;
    fs::rename(temporaryPath, this->_path, error);
    if (error)
    {
        PLOG_ERROR << "Failed to replace store file " << this->_path << ": " << error.message();
        throw runtime_error("JsonFilePersistence::set: Failed to replace " + this->_path.string());
    }
};

#pragma endregion
