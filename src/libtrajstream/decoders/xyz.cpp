#include "../pch.hpp"
#include "../exception.hpp"
#include "../frame_decoder.hpp"
#include "../library.hpp"

using namespace std;

namespace
{
    // one line of text without its terminator, and the offset of the following line
    struct Line
    {
        string_view text;
        size_t nNext;
    };

    inline Line lineAt(string_view raw, size_t nPos)
    {
        size_t nEnd = raw.find('\n', nPos);
        const size_t nNext = (nEnd == string_view::npos) ? raw.size() : nEnd + 1;
        if(nEnd == string_view::npos)
            nEnd = raw.size();

        string_view text = raw.substr(nPos, nEnd - nPos);
        if(!text.empty() && text.back() == '\r')
            text.remove_suffix(1);
        return Line{text, nNext};
    }

    // The atom count line holds exactly one non-negative integer. Every atom
    // line takes at least two bytes, so a count that cannot fit into the
    // nAvailable bytes following the count line is rejected.
    inline optional<size_t> parseAtomCount(string_view line, size_t nAvailable)
    {
        line = trimmed(line);
        if(line.empty())
            return nullopt;

        size_t nAtoms = 0;
        auto [pEnd, ec] = from_chars(line.data(), line.data() + line.size(), nAtoms);
        if(ec != errc() || pEnd != line.data() + line.size())
            return nullopt;
        if(nAtoms > nAvailable / 2)
            return nullopt;
        return nAtoms;
    }

    inline vector<string_view> split(string_view line)
    {
        vector<string_view> tokens;
        size_t nPos = 0;
        while(nPos < line.size())
        {
            while(nPos < line.size() && isspace(static_cast<unsigned char>(line[nPos])))
                ++nPos;
            const size_t nStart = nPos;
            while(nPos < line.size() && !isspace(static_cast<unsigned char>(line[nPos])))
                ++nPos;
            if(nPos > nStart)
                tokens.push_back(line.substr(nStart, nPos - nStart));
        }
        return tokens;
    }

    inline optional<bool> parseFlag(string_view token)
    {
        const string s = to_lower(string(token));
        if(s == "t" || s == "true" || s == "1")
            return true;
        if(s == "f" || s == "false" || s == "0")
            return false;
        return nullopt;
    }
}

// Multi-frame (extended) XYZ:
//   <number of atoms>
//   <comment line with key=value pairs>
//   <element> <x> <y> <z> [more columns as announced by Properties=...]
class XYZFrameDecoder : public FrameDecoder 
{
public:
    ScanStep scanNextFrame(const ScanCursor& cursor) const override
    {
        size_t nPos = cursor.nOffset;
        while(nPos < m_raw.size())
        {
            const Line countLine = lineAt(m_raw, nPos);

            // blank lines between frames are not frames
            if(trimmed(countLine.text).empty())
            {
                nPos = countLine.nNext;
                continue;
            }

            const auto nAtoms = parseAtomCount(countLine.text, m_raw.size() - countLine.nNext);
            if(!nAtoms)
                return lostFrame(nPos, countLine.nNext);

            // skip the comment line and the atom lines without looking at them
            size_t nEnd = countLine.nNext;
            for(size_t iLine = 0; iLine <= *nAtoms; ++iLine)
            {
                if(nEnd >= m_raw.size())
                    return lostFrame(nPos, countLine.nNext);

                const size_t nNewline = m_raw.find('\n', nEnd);
                nEnd = (nNewline == string_view::npos) ? m_raw.size() : nNewline + 1;
            }

            ScanStep step;
            step.kind = ScanStep::Kind::Frame;
            step.nOffset = nPos;
            step.nSize = nEnd - nPos;
            step.next.nOffset = nEnd;
            return step;
        }

        ScanStep end;
        end.next.nOffset = m_raw.size();
        end.nOffset = m_raw.size();
        return end;
    }

    ScanCursor seek(const FrameIndex& entry) const override
    {
        ScanCursor cursor;
        cursor.nOffset = entry.m_nByteOffset;
        return cursor;
    }

    DecodeResult<FramePtr> decodeFrameAt(size_t nOffset, size_t nFrameNumber) const override
    {
        const size_t nPos = skipBlankLines(nOffset);
        if(nPos >= m_raw.size())
            return DecodeError::Truncated;

        const Line countLine = lineAt(m_raw, nPos);
        const auto nAtoms = parseAtomCount(countLine.text, numeric_limits<size_t>::max());
        if(!nAtoms)
            return DecodeError::Corrupt;
        if(countLine.nNext >= m_raw.size() || *nAtoms > (m_raw.size() - countLine.nNext) / 2)
            return DecodeError::Truncated;

        const Line commentLine = lineAt(m_raw, countLine.nNext);
        CommentLine comment = parse_comment(commentLine.text);

        ReadInstructionList aReadInstructions;
        if(comment.sProperties.empty() || !parse_properties(comment.sProperties, aReadInstructions))
            aReadInstructions = defaultReadInstructions();

        vector<Vector3d> aPositions;
        vector<string> aElements;
        map<string, vector<Eigen::VectorXd>> aProperties;
        // an atom line is at least "X 0 0 0\n"
        const size_t nReserve = min(*nAtoms, (m_raw.size() - commentLine.nNext) / 8);
        aPositions.reserve(nReserve);
        aElements.reserve(nReserve);

        size_t nLinePos = commentLine.nNext;
        for(size_t iAtom = 0; iAtom < *nAtoms; ++iAtom)
        {
            if(nLinePos >= m_raw.size())
                return DecodeError::Truncated;

            const Line atomLine = lineAt(m_raw, nLinePos);
            nLinePos = atomLine.nNext;

            const auto tokens = split(atomLine.text);

            string sElement;
            Vector3d vPosition = Vector3d::Zero();
            map<string, Eigen::VectorXd> properties;
            if(!parse_atom(tokens, aReadInstructions, sElement, vPosition, properties))
            {
                cerr << "WARNING: XYZ frame " << nFrameNumber << ": skipping atom " << iAtom 
                     << ", cannot parse line \"" << atomLine.text << "\"\n";
                continue;
            }

            aElements.push_back(sElement);
            aPositions.push_back(vPosition);
            for(const auto& ri : aReadInstructions)
            {
                if(ri.instruction != ReadInstruction::Property)
                    continue;
                auto pValue = properties.find(ri.sName);
                aProperties[ri.sName].push_back(pValue == properties.end() ? Eigen::VectorXd() : pValue->second);
            }
        }

        return createTrajectoryFrame(aPositions, aElements, comment.pLattice, nFrameNumber, std::move(comment.metadata), aProperties);
    }

    DecodeResult<TrajectoryMetadata> decodeMetadataAt(size_t nOffset, size_t nFrameNumber) const override
    {
        const size_t nPos = skipBlankLines(nOffset);
        if(nPos >= m_raw.size())
            return DecodeError::Truncated;

        const Line countLine = lineAt(m_raw, nPos);
        if(!parseAtomCount(countLine.text, m_raw.size() - countLine.nNext))
            return DecodeError::Corrupt;
        if(countLine.nNext >= m_raw.size())
            return DecodeError::Truncated;

        // only the comment line, the atom lines are never touched
        const CommentLine comment = parse_comment(lineAt(m_raw, countLine.nNext).text);

        TrajectoryMetadata metadata;
        metadata.m_nFrameNumber = nFrameNumber;
        metadata.m_nStep = nFrameNumber;
        metadata.m_mProperties = numericEntries(comment.metadata);
        return metadata;
    }

private: 
    enum class ReadInstruction 
    {
        Species,
        Position, 
        Property,   // any other numeric column group, kept as a per-site property
        Ignore
    };

    struct ColumnGroup
    {
        ReadInstruction instruction;
        string sName;
        size_t nFirst;
        size_t nCount;
    };
    typedef vector<ColumnGroup> ReadInstructionList;

    struct CommentLine
    {
        MetadataMap metadata;
        LatticePtr pLattice;
        string sProperties;
    };

    static ReadInstructionList defaultReadInstructions()
    {
        return ReadInstructionList{
            {ReadInstruction::Species, "species", 0, 1},
            {ReadInstruction::Position, "pos", 1, 3}
        };
    }

    size_t skipBlankLines(size_t nPos) const
    {
        while(nPos < m_raw.size())
        {
            const Line line = lineAt(m_raw, nPos);
            if(!trimmed(line.text).empty())
                break;
            nPos = line.nNext;
        }
        return nPos;
    }

    // Marks the record at nPos as one lost frame and resynchronizes at the 
    // next line that is a valid atom count.
    ScanStep lostFrame(size_t nPos, size_t nResume) const
    {
        size_t nNext = nResume;
        while(nNext < m_raw.size())
        {
            const Line line = lineAt(m_raw, nNext);
            if(parseAtomCount(line.text, m_raw.size() - line.nNext))
                break;
            nNext = line.nNext;
        }

        ScanStep step;
        step.kind = ScanStep::Kind::Corrupt;
        step.nOffset = nPos;
        step.nSize = nNext - nPos;
        step.next.nOffset = nNext;
        return step;
    }

    static CommentLine parse_comment(string_view line)
    {
        CommentLine comment;

        KVPairs commentKV;
        parse_comment_line(string(line), commentKV);

        optional<Matrix3d> mLattice;
        Lattice::Pbc pbc{true, true, true};
        for(const auto& [key, value] : commentKV)
        {
            const string sKey = to_lower(key);
            if(sKey == "lattice")
                mLattice = parse_lattice(value);
            else if(sKey == "pbc")
                parse_pbc(value, pbc);
            else if(sKey == "properties")
                comment.sProperties = value;
            else
                comment.metadata[key] = parseMetadataValue(value);
        }

        if(mLattice && !Lattice::isDegenerate(*mLattice))
        {
            comment.pLattice = make_shared<Lattice>(*mLattice, pbc);
            comment.metadata["volume"] = comment.pLattice->volume();
        }

        return comment;
    }

    // Lattice="ax ay az bx by bz cx cy cz"
    static optional<Matrix3d> parse_lattice(const string& sValue)
    {
        const auto tokens = split(sValue);
        if(tokens.size() != 9)
            return nullopt;

        Matrix3d m;
        for(size_t k = 0; k < 9; ++k)
        {
            auto d = parseNumber(tokens[k]);
            if(!d)
                return nullopt;
            m(k / 3, k % 3) = *d;
        }
        return m;
    }

    static void parse_pbc(const string& sValue, Lattice::Pbc& pbc)
    {
        const auto tokens = split(sValue);
        if(tokens.size() != 3)
            return;

        Lattice::Pbc parsed;
        for(size_t k = 0; k < 3; ++k)
        {
            auto bFlag = parseFlag(tokens[k]);
            if(!bFlag)
                return;
            parsed[k] = *bFlag;
        }
        pbc = parsed;
    }

    // Properties=species:S:1:pos:R:3:forces:R:3
    // returns false if the description cannot be used
    static bool parse_properties(const string& sPropString, ReadInstructionList& ri)
    {
        istringstream prop(sPropString);
        string token;
        vector<string> tokens;
        while(getline(prop, token, ':')) 
            tokens.push_back(token);

        if(tokens.empty() || tokens.size() % 3 != 0)
        {
            cerr << "WARNING: malformed Properties \"" << sPropString << "\", using species:S:1:pos:R:3\n";
            return false;
        }

        ReadInstructionList parsed;
        size_t nColumn = 0;
        bool bSpecies = false, bPosition = false;
        for(size_t n = 0; n < tokens.size(); n += 3)
        {
            const string& sName = tokens[n];
            const string sType = to_lower(tokens[n + 1]);
            size_t nCount = 0;
            auto [pEnd, ec] = from_chars(tokens[n + 2].data(), tokens[n + 2].data() + tokens[n + 2].size(), nCount);
            if(ec != errc() || pEnd != tokens[n + 2].data() + tokens[n + 2].size() || nCount == 0)
            {
                cerr << "WARNING: invalid column count in Properties \"" << sPropString << "\", using species:S:1:pos:R:3\n";
                return false;
            }

            // translate from string to ReadInstruction
            ReadInstruction instruction = ReadInstruction::Ignore;
            if(sName == "species" && nCount == 1)
            {
                instruction = ReadInstruction::Species;
                bSpecies = true;
            }
            else if((sName == "pos" || sName == "positions") && nCount == 3)
            {
                instruction = ReadInstruction::Position;
                bPosition = true;
            }
            else if(sType == "r" || sType == "i")
                instruction = ReadInstruction::Property;

            parsed.push_back(ColumnGroup{instruction, sName, nColumn, nCount});
            nColumn += nCount;
        }

        if(!bSpecies || !bPosition)
        {
            cerr << "WARNING: Properties \"" << sPropString << "\" lacks species or pos, using species:S:1:pos:R:3\n";
            return false;
        }

        ri = std::move(parsed);
        return true;
    }

    // returns false if the atom has to be skipped
    static bool parse_atom(const vector<string_view>& tokens, const ReadInstructionList& aReadInstructions, 
            string& sElement, Vector3d& vPosition, map<string, Eigen::VectorXd>& properties)
    {
        for(const auto& ri : aReadInstructions)
        {
            if(ri.instruction == ReadInstruction::Ignore)
                continue;
            if(ri.nFirst + ri.nCount > tokens.size())
            {
                // a missing optional column only drops that property
                if(ri.instruction == ReadInstruction::Property)
                    continue;
                return false;
            }

            switch(ri.instruction)
            {
            case ReadInstruction::Species:
            {
                sElement = string(tokens[ri.nFirst]);
                if(library::isElementSymbol(sElement))
                    break;

                // some writers use atomic numbers instead of symbols
                long nNumber = 0;
                auto [pEnd, ec] = from_chars(sElement.data(), sElement.data() + sElement.size(), nNumber);
                if(ec != errc() || pEnd != sElement.data() + sElement.size())
                    return false;
                sElement = library::symbolForNumber(nNumber);
                if(sElement == "X")
                    return false;
                break;
            }

            case ReadInstruction::Position:
                for(size_t k = 0; k < 3; ++k)
                {
                    auto d = parseNumber(tokens[ri.nFirst + k]);
                    if(!d)
                        return false;
                    vPosition[k] = *d;
                }
                break;

            case ReadInstruction::Property:
            {
                Eigen::VectorXd v(ri.nCount);
                bool bValid = true;
                for(size_t k = 0; k < ri.nCount && bValid; ++k)
                {
                    auto d = parseNumber(tokens[ri.nFirst + k]);
                    bValid = d.has_value();
                    if(bValid)
                        v[k] = *d;
                }
                if(bValid)
                    properties.emplace(ri.sName, v);
                break;
            }

            case ReadInstruction::Ignore:
                break;
            }
        }
        return true;
    }
};


REGISTER(registry::FrameDecoderFactory, "xyz", XYZFrameDecoder);
