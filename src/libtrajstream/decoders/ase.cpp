#include "../pch.hpp"
#include "../exception.hpp"
#include "../frame_decoder.hpp"
#include "../library.hpp"

#include <nlohmann/json.hpp>

using namespace std;
using nlohmann::json;

namespace
{
    // ASE ".traj" files use the Ulm container:
    //   0..7    signature "- of Ulm"
    //   8..23   tag
    //   24      version
    //   32      number of items (frames)
    //   40      position of the offsets table
    // every number is a little endian 8 byte integer
    const string ULM_SIGNATURE = "- of Ulm";
    constexpr size_t ULM_HEADER_SIZE = 48;
    constexpr size_t ULM_SIGNATURE_SIZE = 24;

    // larger payloads are not parsed when only plot metadata is requested
    constexpr uint64_t MAX_METADATA_SIZE = 50 * 1024 * 1024;

    inline optional<uint64_t> readUInt(string_view raw, size_t nOffset, size_t nBytes)
    {
        if(nOffset > raw.size() || raw.size() - nOffset < nBytes)
            return nullopt;

        uint64_t u = 0;
        for(size_t k = nBytes; k-- > 0; )
            u = (u << 8) | static_cast<unsigned char>(raw[nOffset + k]);
        return u;
    }

    inline optional<int64_t> readInt64(string_view raw, size_t nOffset)
    {
        auto u = readUInt(raw, nOffset, 8);
        if(!u)
            return nullopt;
        return static_cast<int64_t>(*u);
    }

    // one element of an ndarray, converted to double
    inline optional<double> readElement(string_view raw, size_t nOffset, const string& sDType)
    {
        if(sDType == "float64")
        {
            auto u = readUInt(raw, nOffset, 8);
            if(!u)
                return nullopt;
            double d;
            memcpy(&d, &*u, sizeof(d));
            return d;
        }
        if(sDType == "float32")
        {
            auto u = readUInt(raw, nOffset, 4);
            if(!u)
                return nullopt;
            const uint32_t u32 = static_cast<uint32_t>(*u);
            float f;
            memcpy(&f, &u32, sizeof(f));
            return static_cast<double>(f);
        }
        if(sDType == "int64")
        {
            auto n = readInt64(raw, nOffset);
            if(!n)
                return nullopt;
            return static_cast<double>(*n);
        }
        if(sDType == "int32")
        {
            auto u = readUInt(raw, nOffset, 4);
            if(!u)
                return nullopt;
            return static_cast<double>(static_cast<int32_t>(static_cast<uint32_t>(*u)));
        }
        if(sDType == "bool")
        {
            auto u = readUInt(raw, nOffset, 1);
            if(!u)
                return nullopt;
            return *u ? 1.0 : 0.0;
        }
        return nullopt;
    }

    inline size_t elementSize(const string& sDType)
    {
        if(sDType == "float64" || sDType == "int64")
            return 8;
        if(sDType == "float32" || sDType == "int32")
            return 4;
        if(sDType == "bool")
            return 1;
        return 0;
    }

    // Numeric array in row-major order together with its shape.
    struct Array
    {
        vector<size_t> aShape;
        vector<double> aData;
    };

    // member lookup, ASE appends a '.' to keys of arrays stored outside the JSON
    inline const json* member(const json& obj, const string& sKey)
    {
        if(!obj.is_object())
            return nullptr;
        auto pValue = obj.find(sKey + ".");
        if(pValue != obj.end())
            return &*pValue;
        pValue = obj.find(sKey);
        if(pValue != obj.end())
            return &*pValue;
        return nullptr;
    }

    bool flatten(const json& value, size_t nDepth, Array& array)
    {
        if(value.is_array())
        {
            if(array.aShape.size() == nDepth)
                array.aShape.push_back(value.size());
            else if(array.aShape.size() < nDepth || array.aShape[nDepth] != value.size())
                return false;   // ragged

            for(const auto& item : value)
            {
                if(!flatten(item, nDepth + 1, array))
                    return false;
            }
            return true;
        }

        if(array.aShape.size() != nDepth)
            return false;
        if(value.is_boolean())
            array.aData.push_back(value.get<bool>() ? 1.0 : 0.0);
        else if(value.is_number())
            array.aData.push_back(value.get<double>());
        else
            return false;
        return true;
    }

    // reads an inline JSON array or an {"ndarray": [shape, dtype, offset]} reference
    optional<Array> readArray(string_view raw, const json& value)
    {
        Array array;
        const json* pRef = member(value, "ndarray");
        if(!pRef)
        {
            if(!flatten(value, 0, array))
                return nullopt;
            return array;
        }

        if(!pRef->is_array() || pRef->size() != 3)
            return nullopt;

        const json& shape = (*pRef)[0];
        const json& dtype = (*pRef)[1];
        const json& offset = (*pRef)[2];
        if(!shape.is_array() || !dtype.is_string() || !offset.is_number_integer())
            return nullopt;

        size_t nTotal = 1;
        for(const auto& dim : shape)
        {
            if(!dim.is_number_integer() || dim.get<int64_t>() < 0)
                return nullopt;
            array.aShape.push_back(dim.get<size_t>());
            nTotal *= array.aShape.back();
        }

        const string sDType = dtype.get<string>();
        const size_t nElementSize = elementSize(sDType);
        const int64_t nOffset = offset.get<int64_t>();
        if(nElementSize == 0 || nOffset < 0 || static_cast<uint64_t>(nOffset) > raw.size()
                || (raw.size() - static_cast<size_t>(nOffset)) / nElementSize < nTotal)
            return nullopt;

        array.aData.reserve(nTotal);
        for(size_t i = 0; i < nTotal; ++i)
        {
            auto d = readElement(raw, static_cast<size_t>(nOffset) + i * nElementSize, sDType);
            if(!d)
                return nullopt;
            array.aData.push_back(*d);
        }
        return array;
    }

    // scalar entries of a JSON object are copied into the metadata, arrays are not
    void copyScalars(const json& obj, MetadataMap& metadata)
    {
        if(!obj.is_object())
            return;

        for(const auto& item : obj.items())
        {
            const json& value = item.value();
            if(value.is_boolean())
                metadata[item.key()] = value.get<bool>() ? 1.0 : 0.0;
            else if(value.is_number())
                metadata[item.key()] = value.get<double>();
            else if(value.is_string())
                metadata[item.key()] = value.get<string>();
        }
    }

    // per-atom arrays that are never needed for plot metadata
    bool isPerAtomKey(const string& sKey)
    {
        static const set<string> keys = {
            "positions", "positions.", "numbers", "numbers.", 
            "momenta", "momenta.", "forces", "forces."
        };
        return keys.find(sKey) != keys.end();
    }
}

class AseFrameDecoder : public FrameDecoder
{
public:
    void open(string_view raw) override
    {
        FrameDecoder::open(raw);
        m_nItems = 0;
        m_nOffsetsPos = 0;

        if(raw.size() < ULM_HEADER_SIZE || raw.substr(0, ULM_SIGNATURE.size()) != ULM_SIGNATURE)
            return;

        const int64_t nItems = readInt64(raw, ULM_SIGNATURE_SIZE + 8).value_or(0);
        const int64_t nOffsetsPos = readInt64(raw, ULM_SIGNATURE_SIZE + 16).value_or(-1);
        if(nItems <= 0 || nOffsetsPos < 0 || static_cast<uint64_t>(nOffsetsPos) > raw.size())
            return;

        // a table running past the end of the input only provides the slots that exist
        m_nOffsetsPos = static_cast<size_t>(nOffsetsPos);
        m_nItems = std::min(static_cast<size_t>(nItems), (raw.size() - m_nOffsetsPos) / 8);
    }

    ScanStep scanNextFrame(const ScanCursor& cursor) const override
    {
        ScanStep step;
        if(cursor.nRecord >= m_nItems)
        {
            step.nOffset = m_raw.size();
            step.next = cursor;
            return step;
        }

        step.next.nRecord = cursor.nRecord + 1;
        step.kind = ScanStep::Kind::Corrupt;

        auto payload = payloadOf(cursor.nRecord);
        if(!payload || !isJsonObject(m_raw.substr(payload->first + 8, payload->second)))
            return step;

        step.kind = ScanStep::Kind::Frame;
        step.nOffset = payload->first;
        step.nSize = 8 + payload->second;
        step.next.nOffset = step.nOffset + step.nSize;
        return step;
    }

    ScanCursor seek(const FrameIndex& entry) const override
    {
        ScanCursor cursor;
        cursor.nOffset = entry.m_nByteOffset;
        cursor.nRecord = entry.m_nFrameNumber;
        return cursor;
    }

    DecodeResult<FramePtr> decodeFrameAt(size_t nOffset, size_t nFrameNumber) const override
    {
        auto payload = parsePayload(nOffset, nullptr);
        if(!payload)
            return DecodeError::Corrupt;

        try
        {
            const json& frame = *payload;

            const json* pPositions = member(frame, "positions");
            if(!pPositions)
                return DecodeError::Corrupt;
            auto positions = readArray(m_raw, *pPositions);
            if(!positions || positions->aData.size() % 3 != 0)
                return DecodeError::Corrupt;
            const size_t nAtoms = positions->aData.size() / 3;

            // frames of a fixed composition only store the numbers once
            optional<Array> numbers;
            if(const json* pNumbers = member(frame, "numbers"))
                numbers = readArray(m_raw, *pNumbers);
            else
                numbers = firstFrameNumbers();
            if(!numbers || numbers->aData.size() != nAtoms)
                return DecodeError::Corrupt;

            vector<Vector3d> aPositions(nAtoms);
            vector<string> aElements(nAtoms);
            for(size_t i = 0; i < nAtoms; ++i)
            {
                aPositions[i] = Vector3d(positions->aData[3 * i], positions->aData[3 * i + 1], positions->aData[3 * i + 2]);
                aElements[i] = library::symbolForNumber(static_cast<long>(std::lround(numbers->aData[i])));
            }

            map<string, vector<Eigen::VectorXd>> aProperties;
            if(const json* pCalculator = member(frame, "calculator"))
            {
                if(const json* pForces = member(*pCalculator, "forces"))
                {
                    auto forces = readArray(m_raw, *pForces);
                    if(forces && forces->aData.size() == 3 * nAtoms)
                    {
                        auto& aForces = aProperties["forces"];
                        for(size_t i = 0; i < nAtoms; ++i)
                        {
                            Eigen::VectorXd vForce(3);
                            vForce << forces->aData[3 * i], forces->aData[3 * i + 1], forces->aData[3 * i + 2];
                            aForces.push_back(vForce);
                        }
                    }
                }
            }

            LatticePtr pLattice = latticeOf(frame);
            return createTrajectoryFrame(aPositions, aElements, pLattice, nFrameNumber, metadataOf(frame, pLattice), aProperties);
        }
        catch(const json::exception& e)
        {
            cerr << "WARNING: ASE frame " << nFrameNumber << ": " << e.what() << "\n";
            return DecodeError::Corrupt;
        }
    }

    DecodeResult<TrajectoryMetadata> decodeMetadataAt(size_t nOffset, size_t nFrameNumber) const override
    {
        const auto nLength = readInt64(m_raw, nOffset);
        if(nLength && *nLength > 0 && static_cast<uint64_t>(*nLength) > MAX_METADATA_SIZE)
        {
            cerr << "WARNING: skipping metadata of ASE frame " << nFrameNumber << ", payload of " 
                 << (*nLength >> 20) << " MB\n";
            return DecodeError::Corrupt;
        }

        // the per-atom arrays are dropped while parsing
        const json::parser_callback_t skipPerAtom = [](int /*depth*/, json::parse_event_t event, json& parsed)
        {
            return !(event == json::parse_event_t::key && isPerAtomKey(parsed.get<string>()));
        };

        auto payload = parsePayload(nOffset, skipPerAtom);
        if(!payload)
            return DecodeError::Corrupt;

        try
        {
            TrajectoryMetadata metadata;
            metadata.m_nFrameNumber = nFrameNumber;
            metadata.m_nStep = nFrameNumber;
            metadata.m_mProperties = numericEntries(metadataOf(*payload, latticeOf(*payload)));
            return metadata;
        }
        catch(const json::exception& e)
        {
            cerr << "WARNING: ASE frame " << nFrameNumber << ": " << e.what() << "\n";
            return DecodeError::Corrupt;
        }
    }

    double progressOf(const ScanCursor& cursor) const override
    {
        if(m_nItems == 0)
            return 100;
        return 100.0 * static_cast<double>(std::min(cursor.nRecord, m_nItems)) / static_cast<double>(m_nItems);
    }

    size_t progressInterval() const override
    {
        return 5000;
    }

private:
    // offset and length of the payload of record nRecord, if it lies inside the input
    optional<pair<size_t, size_t>> payloadOf(size_t nRecord) const
    {
        const auto nFrameOffset = readInt64(m_raw, m_nOffsetsPos + 8 * nRecord);
        if(!nFrameOffset || *nFrameOffset < 0)
            return nullopt;

        const size_t nOffset = static_cast<size_t>(*nFrameOffset);
        const auto nLength = readInt64(m_raw, nOffset);
        if(!nLength || *nLength < 0 || static_cast<uint64_t>(*nLength) > m_raw.size() - nOffset - 8)
            return nullopt;

        return make_pair(nOffset, static_cast<size_t>(*nLength));
    }

    // validates without building the document, so the scan stays linear in the input size
    static bool isJsonObject(string_view text)
    {
        const string_view body = trimmed(text);
        return !body.empty() && body.front() == '{' && json::accept(body.begin(), body.end());
    }

    // length prefixed JSON payload at nOffset, nullopt if it is missing or does not parse
    optional<json> parsePayload(size_t nOffset, const json::parser_callback_t& callback) const
    {
        const auto nLength = readInt64(m_raw, nOffset);
        if(!nLength || *nLength < 0 || static_cast<uint64_t>(*nLength) > m_raw.size() - nOffset - 8)
            return nullopt;

        const string_view text = m_raw.substr(nOffset + 8, static_cast<size_t>(*nLength));
        json payload = json::parse(text.begin(), text.end(), callback, false);
        if(payload.is_discarded() || !payload.is_object())
            return nullopt;
        return payload;
    }

    optional<Array> firstFrameNumbers() const
    {
        auto first = payloadOf(0);
        if(!first)
            return nullopt;

        auto payload = parsePayload(first->first, nullptr);
        if(!payload)
            return nullopt;

        const json* pNumbers = member(*payload, "numbers");
        if(!pNumbers)
            return nullopt;
        return readArray(m_raw, *pNumbers);
    }

    LatticePtr latticeOf(const json& frame) const
    {
        const json* pCell = member(frame, "cell");
        if(!pCell)
            return nullptr;

        auto cell = readArray(m_raw, *pCell);
        if(!cell || cell->aData.size() != 9)
            return nullptr;

        Matrix3d mCell;
        for(size_t k = 0; k < 9; ++k)
            mCell(k / 3, k % 3) = cell->aData[k];
        if(Lattice::isDegenerate(mCell))
            return nullptr;

        Lattice::Pbc pbc{true, true, true};
        if(const json* pPbc = member(frame, "pbc"))
        {
            auto flags = readArray(m_raw, *pPbc);
            if(flags && flags->aData.size() == 3)
                pbc = Lattice::Pbc{flags->aData[0] != 0, flags->aData[1] != 0, flags->aData[2] != 0};
        }

        return make_shared<Lattice>(mCell, pbc);
    }

    static MetadataMap metadataOf(const json& frame, const LatticePtr& pLattice)
    {
        MetadataMap metadata;
        if(const json* pCalculator = member(frame, "calculator"))
            copyScalars(*pCalculator, metadata);
        if(const json* pInfo = member(frame, "info"))
            copyScalars(*pInfo, metadata);
        if(pLattice)
            metadata["volume"] = pLattice->volume();
        return metadata;
    }

    size_t m_nItems = 0;
    size_t m_nOffsetsPos = 0;
};


REGISTER(registry::FrameDecoderFactory, "traj", AseFrameDecoder);
