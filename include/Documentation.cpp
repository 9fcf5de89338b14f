// ---- CODEC ----
// Codec Documentation
/*
DOCUMENTATION:
MODULE: chunkcache::codec

TYPES:
. enum class CodecType { Base64, Hex, Base32, Base85, UUEncode, YEnc }
    - Closed set of supported encodings
. struct CodecTraits
    - name, extension: identifiers used in cache directory and segment file names
    - overhead: encoded/binary size ratio used for planning and estimates
    - alignment: binary bytes per atomic encoding unit
    - binary_output: true when output is raw 8-bit data (yEnc)
    - encode, decode: function pointers for the codec

FUNCTIONS:
  . const CodecTraits& traits(CodecType type)
      - Row of the codec table for type
  . CodecType parse_codec(const std::string& name)
      - Case-insensitive lookup by name
      - Throws InvalidArgumentError for unknown names
  . std::string encode(CodecType type, const std::string& data)
  . std::string decode(CodecType type, const std::string& encoded)
      - Pure and deterministic, empty input gives empty output
      - decode throws InvalidArgumentError on malformed input
  . std::uint64_t estimate_encoded_size(CodecType type, std::uint64_t binary_size)
      - ceil(binary_size * overhead)

FORMATS:
  . base64, base32: RFC 4648 alphabets with '=' padding
  . hex: two lowercase digits per byte
  . base85: ASCII85 alphabet '!'..'u', a trailing group of n bytes keeps n + 1
    symbols, no 'z' shorthand
  . uuencode: value + 32 per 6 bits, '`' for zero, no padding or line framing
  . yEnc: (b + 42) mod 256, NUL/LF/CR/'=' escaped as '=' + (value + 64) mod 256
*/

// ---- PLANNER ----
// ChunkPlanner Documentation
/*
DOCUMENTATION:
FUNCTION: planner::plan_read_size

  . std::size_t plan_read_size(std::size_t target_size, CodecType codec)
      - B = floor((target_size / overhead) / alignment) * alignment
      - Raised to one alignment quantum when B would be 0
      - Throws InvalidArgumentError when target_size is 0
*/

// ---- LOGGER ----
// Logger Documentation
/*
DOCUMENTATION:
MODULE: chunkcache::logging

FUNCTIONS:
  . void init_logging(const std::string& log_file, severity_level min_level)
      - Replaces all sinks with a synchronous text file sink
      - Appends to log_file, flushes after every record
      - Format: timestamp, severity, thread id, message
  . void init_console_logging(severity_level min_level)
      - Replaces all sinks with a console sink on std::clog
  . severity_level parse_severity(const std::string& name)
      - Throws InvalidArgumentError for unknown level names
  . void set_log_level(severity_level min_level)
  . void enable_logging() / void disable_logging()

USAGE:
  BOOST_LOG_TRIVIAL(info) << "Store: Materializing " << name;
  Messages are prefixed with the emitting component ("Store:", "Registry:", ...)
*/

// ---- STORE ----
// EncodingKey Documentation
/*
DOCUMENTATION:
STRUCT: EncodingKey

VARIABLES:
. std::string file_id
    - Full hex SHA-256 of the file contents
. CodecType codec
. Mode mode
    - Streaming or Monolithic

METHODS:
  . std::string directory_name() const
      - {file_id}_{codec} for streaming, {file_id}_{codec}_full for monolithic
  . bool operator<(const EncodingKey&) const
      - Orders keys for use in std::map and std::set
*/

// SegmentWriter Documentation
/*
DOCUMENTATION:
CLASS: SegmentWriter

VARIABLES:
. EncodingKey key_
. std::filesystem::path staging_dir_
    - {cache_root}/.staging_{directory_name}
. std::filesystem::path final_dir_
    - {cache_root}/{directory_name}
. SegmentManifest manifest_
    - Sizes of the segments written so far
. bool committed_

CONSTRUCTOR:
. SegmentWriter(const EncodingKey& key, path staging_dir, path final_dir)
    - Removes leftovers and creates an empty staging directory
    - Throws MaterializationError if the directory cannot be created

DESTRUCTOR:
. ~SegmentWriter()
    - Calls abort() unless commit() succeeded

METHODS:
  . void append(const std::string& encoded)
      - Writes encoded as segment_{n}.{ext} in binary mode
      - Throws MaterializationError on I/O failure
  . SegmentManifest commit()
      - Writes the manifest (tmp file + rename), then renames the staging
        directory to the final directory
  . void abort()
      - Removes the staging directory, errors are logged only
*/

// SegmentStore Documentation
/*
DOCUMENTATION:
CLASS: SegmentStore

VARIABLES:
. std::filesystem::path cache_root_
. std::mutex state_mutex_
    - Guards guards_, in_progress_, manifests_ and file_generations_
. std::map<EncodingKey, std::shared_ptr<std::mutex>> guards_
    - One mutex per key, held for the whole check-then-materialize sequence
. std::set<EncodingKey> in_progress_
. std::map<EncodingKey, SegmentManifest> manifests_
    - Committed manifests, filled lazily from disk
. std::map<std::string, std::uint64_t> file_generations_
    - Bumped by remove_file(), absent means 0
. std::atomic<std::size_t> materializations_

CONSTRUCTOR:
. explicit SegmentStore(const std::string& cache_root)
    - Creates cache_root if needed
    - Removes staging directories of interrupted runs

METHODS:
Public:
  Materialization:
  . SegmentManifest materialize(const EncodingKey& key, const Producer& producer)
      - Returns the committed manifest without calling producer if present
      - Otherwise runs producer against a SegmentWriter and commits
      - Concurrent callers of one key wait for the first and share its result
      - Other keys proceed in parallel
      - On failure nothing remains on disk and MaterializationError is thrown
  . SegmentManifest materialize(key, producer, std::uint64_t generation)
      - Throws NotFoundError if file_generation(key.file_id) moved past
        generation, checked under the key's mutex

  Query Operations:
  . bool has(const EncodingKey& key) const
  . std::uint64_t file_generation(const std::string& file_id) const
  . MaterializationState state(const EncodingKey& key) const
  . std::optional<SegmentManifest> find_manifest(const EncodingKey& key) const
  . SegmentManifest get_manifest(const EncodingKey& key) const
      - Throws NotFoundError if absent
  . std::string read_segment_slice(key, index, offset, length) const
      - Throws NotFoundError if the segment file is missing or short

  Removal:
  . void remove(const EncodingKey& key)
  . std::size_t remove_file(const std::string& file_id)
      - Bumps the file generation, waits for running materializations of
        the file, then deletes every directory named {file_id}_*
  . void clear()
*/

// ---- READER ----
// RangeReader Documentation
/*
DOCUMENTATION:
CLASS: RangeReader

METHODS:
  . std::string read_range(const EncodingKey& key, uint64_t start, uint64_t end) const
      - Bytes [start, end) of the concatenated segments of key
      - Truncated at the end of the encoded stream
      - Only the overlapping slice of each segment is read
      - Throws InvalidArgumentError if start > end
      - Throws NotFoundError if key is not materialized or a segment is missing
*/

// ---- REGISTRY ----
// FileRegistry Documentation
/*
DOCUMENTATION:
CLASS: FileRegistry

VARIABLES:
. CodecType default_codec_
. std::uint64_t default_chunk_size_
    - Used for estimated_encoded_size and default_chunks of new records
. std::map<std::string, FileRecord> records_
    - Keyed by full content hash, guarded by mutex_

METHODS:
  . FileRecord register_file(const path& path)
      - Hashes outside the lock, returns the existing record for known content
      - Throws NotFoundError if path is not a regular file
  . FileRecord import_file(const path& source, const path& input_dir)
      - Copies source into input_dir without overwriting, then registers it
  . ScanResult scan(const path& directory)
      - Rehashes every regular file, unreadable files are skipped
      - Records of directory whose content moved to another file follow it
      - Records whose content is gone are dropped and listed in removed_ids
  . std::string expand_id(const std::string& prefix) const
      - Throws NotFoundError when nothing matches
      - Throws InvalidArgumentError when the prefix is empty or ambiguous
*/

// ---- SERVICE ----
// ChunkService Documentation
/*
DOCUMENTATION:
CLASS: ChunkService

METHODS:
  . ChunkResponse get_chunk(file_id, chunk_index, chunk_size, codec, mode)
      - Validates chunk_size against [min_chunk_size, max_chunk_size]
      - Materializes (file_id, codec, mode) on first use
      - MaterializationError when the source no longer hashes to file_id
      - total_chunks = ceil(encoded_length / chunk_size)
      - Throws NotFoundError when chunk_index >= total_chunks
  . FileInfo get_info(file_id, chunk_size, codec, mode) const
      - Measured sizes once materialized, estimates before
  . void delete_file(const std::string& file_id)
  . std::size_t rescan()
      - Removes the caches of every id the registry scan dropped
  . std::vector<FileRecord> list_files()
  . HealthStatus health()
      - Both rescan the input folder first
*/
