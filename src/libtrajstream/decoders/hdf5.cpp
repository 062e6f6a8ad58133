#include "../pch.hpp"
#include "../exception.hpp"
#include "../frame_decoder.hpp"
#include "../library.hpp"

#include <H5Cpp.h>

using namespace std;

namespace
{
    const string HDF5_SIGNATURE("\x89HDF\r\n\x1a\n", 8);

    // the HDF5 library is not reentrant
    std::mutex& hdf5Mutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    // the signature sits at offset 0 or, behind a user block, at 512, 1024, 2048, ...
    bool hasHdf5Signature(string_view raw)
    {
        for(size_t nOffset = 0; nOffset + HDF5_SIGNATURE.size() <= raw.size(); nOffset = (nOffset == 0) ? 512 : 2 * nOffset)
        {
            if(raw.substr(nOffset, HDF5_SIGNATURE.size()) == HDF5_SIGNATURE)
                return true;
        }
        return false;
    }

    // Opens a copy of raw as an in-memory file; nothing is written to disk.
    unique_ptr<H5::H5File> openFileImage(string_view raw)
    {
        static atomic<size_t> nImages{0};

        H5::FileAccPropList fapl;
        fapl.setCore(1 << 20, false);
        if(H5Pset_file_image(fapl.getId(), const_cast<char*>(raw.data()), raw.size()) < 0)
            THROW(runtime_error, "cannot attach a file image of ", raw.size(), " bytes");

        const string sName = sprint("trajstream-image-", nImages++, ".h5");
        return make_unique<H5::H5File>(sName, H5F_ACC_RDONLY, H5::FileCreatPropList::DEFAULT, fapl);
    }

    // dataset names searched for, in order of preference
    const vector<string> POSITION_NAMES = {"positions"};
    const vector<string> NUMBER_NAMES = {"atomic_numbers", "numbers", "Z", "species"};
    const vector<string> CELL_NAMES = {"cell", "cells", "lattice"};
    const vector<string> ENERGY_NAMES = {"potential_energy", "energy"};
}

// Structured trajectories (e.g. written by torch-sim). The group layout is
// not fixed; datasets are found anywhere in the file by their name:
//   positions       (F, N, 3) or (N, 3)
//   atomic numbers  (N) or (F, N)
//   cells           (F, 3, 3) or (3, 3), lattice vectors in columns
//   energies        (F) or (F, 1)
class Hdf5FrameDecoder : public FrameDecoder
{
public:
    ~Hdf5FrameDecoder() override
    {
        std::lock_guard<std::mutex> lock(hdf5Mutex());
        m_pFile.reset();
    }

    void open(string_view raw) override
    {
        FrameDecoder::open(raw);

        std::lock_guard<std::mutex> lock(hdf5Mutex());
        m_pFile.reset();
        m_nFrames = 0;

        if(!hasHdf5Signature(raw))
            return;

        H5::Exception::dontPrint();
        try
        {
            m_pFile = openFileImage(raw);
            discover(*m_pFile, "");

            if(m_sPositions.empty() || m_sNumbers.empty())
            {
                cerr << "WARNING: HDF5 input lacks a " << (m_sPositions.empty() ? "positions" : "atomic numbers") << " dataset\n";
                return;
            }

            const auto aPosDims = dimsOf(m_sPositions);
            if(aPosDims.size() == 3 && aPosDims[2] == 3)
            {
                m_nFrames = aPosDims[0];
                m_nAtoms = aPosDims[1];
            }
            else if(aPosDims.size() == 2 && aPosDims[1] == 3)
            {
                m_nFrames = 1;
                m_nAtoms = aPosDims[0];
            }
            else
            {
                cerr << "WARNING: HDF5 dataset " << m_sPositions << " is not shaped (frames, atoms, 3)\n";
                return;
            }

            H5::DataSet positions = m_pFile->openDataSet(m_sPositions);
            const haddr_t nAddress = positions.getOffset();
            m_nBaseOffset = (nAddress == HADDR_UNDEF) ? 0 : static_cast<size_t>(nAddress);
            m_nFrameBytes = m_nAtoms * 3 * positions.getDataType().getSize();
        }
        catch(const H5::Exception& e)
        {
            cerr << "WARNING: cannot open HDF5 input: " << e.getDetailMsg() << "\n";
            m_pFile.reset();
            m_nFrames = 0;
        }
    }

    ScanStep scanNextFrame(const ScanCursor& cursor) const override
    {
        ScanStep step;
        if(cursor.nRecord >= m_nFrames)
        {
            step.nOffset = m_raw.size();
            step.next = cursor;
            return step;
        }

        // offsets are only informative, frames are addressed by number
        step.kind = ScanStep::Kind::Frame;
        step.nOffset = m_nBaseOffset + cursor.nRecord * std::max<size_t>(m_nFrameBytes, 1);
        step.nSize = m_nFrameBytes;
        step.next.nRecord = cursor.nRecord + 1;
        step.next.nOffset = step.nOffset + std::max<size_t>(m_nFrameBytes, 1);
        return step;
    }

    ScanCursor seek(const FrameIndex& entry) const override
    {
        ScanCursor cursor;
        cursor.nOffset = entry.m_nByteOffset;
        cursor.nRecord = entry.m_nFrameNumber;
        return cursor;
    }

    DecodeResult<FramePtr> decodeFrameAt(size_t /*nOffset*/, size_t nFrameNumber) const override
    {
        std::lock_guard<std::mutex> lock(hdf5Mutex());
        if(!m_pFile || nFrameNumber >= m_nFrames)
            return DecodeError::Corrupt;

        try
        {
            const auto aPositionData = readFrameSlice(m_sPositions, 2, nFrameNumber);
            auto aNumberData = readFrameSlice(m_sNumbers, 1, nFrameNumber);
            if(aNumberData.empty())
                aNumberData = readFrameSlice(m_sNumbers, 1, 0);
            if(aPositionData.size() != 3 * m_nAtoms || aNumberData.size() != m_nAtoms)
                return DecodeError::Corrupt;

            vector<Vector3d> aPositions(m_nAtoms);
            vector<string> aElements(m_nAtoms);
            for(size_t i = 0; i < m_nAtoms; ++i)
            {
                aPositions[i] = Vector3d(aPositionData[3 * i], aPositionData[3 * i + 1], aPositionData[3 * i + 2]);
                aElements[i] = library::symbolForNumber(static_cast<long>(std::lround(aNumberData[i])));
            }

            LatticePtr pLattice = latticeAt(nFrameNumber);
            return createTrajectoryFrame(aPositions, aElements, pLattice, nFrameNumber, metadataAt(nFrameNumber, pLattice));
        }
        catch(const H5::Exception& e)
        {
            cerr << "WARNING: HDF5 frame " << nFrameNumber << ": " << e.getDetailMsg() << "\n";
            return DecodeError::Corrupt;
        }
    }

    DecodeResult<TrajectoryMetadata> decodeMetadataAt(size_t /*nOffset*/, size_t nFrameNumber) const override
    {
        std::lock_guard<std::mutex> lock(hdf5Mutex());
        if(!m_pFile || nFrameNumber >= m_nFrames)
            return DecodeError::Corrupt;

        try
        {
            TrajectoryMetadata metadata;
            metadata.m_nFrameNumber = nFrameNumber;
            metadata.m_nStep = nFrameNumber;
            metadata.m_mProperties = numericEntries(metadataAt(nFrameNumber, latticeAt(nFrameNumber)));
            return metadata;
        }
        catch(const H5::Exception& e)
        {
            cerr << "WARNING: HDF5 frame " << nFrameNumber << ": " << e.getDetailMsg() << "\n";
            return DecodeError::Corrupt;
        }
    }

    double progressOf(const ScanCursor& cursor) const override
    {
        if(m_nFrames == 0)
            return 100;
        return 100.0 * static_cast<double>(std::min(cursor.nRecord, m_nFrames)) / static_cast<double>(m_nFrames);
    }

private:
    // all functions below expect the caller to hold hdf5Mutex()

    void discover(const H5::Group& group, const string& sPath)
    {
        for(hsize_t i = 0; i < group.getNumObjs(); ++i)
        {
            const string sName = group.getObjnameByIdx(i);
            const string sFullPath = sPath + "/" + sName;

            switch(group.childObjType(sName))
            {
            case H5O_TYPE_GROUP:
                discover(group.openGroup(sName), sFullPath);
                break;

            case H5O_TYPE_DATASET:
            {
                const H5T_class_t typeClass = group.openDataSet(sName).getTypeClass();
                if(typeClass != H5T_INTEGER && typeClass != H5T_FLOAT)
                    break;

                assign(m_sPositions, POSITION_NAMES, sName, sFullPath);
                assign(m_sNumbers, NUMBER_NAMES, sName, sFullPath);
                assign(m_sCells, CELL_NAMES, sName, sFullPath);
                assign(m_sEnergies, ENERGY_NAMES, sName, sFullPath);
                break;
            }

            default:
                break;
            }
        }
    }

    static void assign(string& sTarget, const vector<string>& aNames, const string& sName, const string& sFullPath)
    {
        if(sTarget.empty() && std::find(aNames.begin(), aNames.end(), sName) != aNames.end())
            sTarget = sFullPath;
    }

    vector<hsize_t> dimsOf(const string& sPath) const
    {
        H5::DataSpace space = m_pFile->openDataSet(sPath).getSpace();
        vector<hsize_t> aDims(space.getSimpleExtentNdims());
        if(!aDims.empty())
            space.getSimpleExtentDims(aDims.data());
        return aDims;
    }

    // Reads the slice of frame nFrame from a dataset whose per-frame shape has 
    // nStaticRank dimensions. A dataset without the leading frame axis is shared 
    // by all frames and read completely. Returns an empty vector if there is no such frame.
    vector<double> readFrameSlice(const string& sPath, int nStaticRank, size_t nFrame) const
    {
        H5::DataSet dataset = m_pFile->openDataSet(sPath);
        H5::DataSpace fileSpace = dataset.getSpace();
        const int nRank = fileSpace.getSimpleExtentNdims();

        vector<hsize_t> aDims(nRank);
        if(nRank > 0)
            fileSpace.getSimpleExtentDims(aDims.data());

        vector<hsize_t> aStart(nRank, 0);
        vector<hsize_t> aCount(aDims);
        if(nRank == nStaticRank + 1)
        {
            if(nFrame >= aDims[0])
                return {};
            aStart[0] = nFrame;
            aCount[0] = 1;
            fileSpace.selectHyperslab(H5S_SELECT_SET, aCount.data(), aStart.data());
        }
        else if(nRank != nStaticRank)
            return {};

        size_t nTotal = 1;
        for(auto n : aCount)
            nTotal *= n;

        vector<double> aData(nTotal);
        if(nTotal == 0)
            return aData;

        H5::DataSpace memSpace = (nRank == 0) ? H5::DataSpace(H5S_SCALAR) : H5::DataSpace(nRank, aCount.data());
        dataset.read(aData.data(), H5::PredType::NATIVE_DOUBLE, memSpace, fileSpace);
        return aData;
    }

    LatticePtr latticeAt(size_t nFrame) const
    {
        if(m_sCells.empty())
            return nullptr;

        const auto aCell = readFrameSlice(m_sCells, 2, nFrame);
        if(aCell.size() != 9)
            return nullptr;

        // stored with the lattice vectors as columns
        Matrix3d mCell;
        for(size_t k = 0; k < 9; ++k)
            mCell(k % 3, k / 3) = aCell[k];
        if(Lattice::isDegenerate(mCell))
            return nullptr;
        return make_shared<Lattice>(mCell);
    }

    MetadataMap metadataAt(size_t nFrame, const LatticePtr& pLattice) const
    {
        MetadataMap metadata;
        if(!m_sEnergies.empty())
        {
            const auto aDims = dimsOf(m_sEnergies);
            const auto aEnergy = readFrameSlice(m_sEnergies, aDims.size() == 2 ? 1 : 0, nFrame);
            if(!aEnergy.empty())
                metadata["energy"] = aEnergy.front();
        }
        if(pLattice)
            metadata["volume"] = pLattice->volume();
        return metadata;
    }

    unique_ptr<H5::H5File> m_pFile;
    string m_sPositions, m_sNumbers, m_sCells, m_sEnergies;
    size_t m_nFrames = 0;
    size_t m_nAtoms = 0;
    size_t m_nBaseOffset = 0;
    size_t m_nFrameBytes = 0;
};


REGISTER(registry::FrameDecoderFactory, "h5", Hdf5FrameDecoder);
