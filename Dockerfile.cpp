FROM ubuntu:22.04 as builder

# Install build dependencies
RUN apt-get update && apt-get install -y \
    build-essential \
    cmake \
    pkg-config \
    libsqlite3-dev \
    libpqxx-dev \
    nlohmann-json3-dev \
    libgtest-dev \
    && rm -rf /var/lib/apt/lists/*

# D++ has no Ubuntu package; the release .deb is expected in the build context
COPY libdpp.deb /tmp/libdpp.deb
RUN apt-get update && apt-get install -y /tmp/libdpp.deb && rm -rf /var/lib/apt/lists/* /tmp/libdpp.deb

# Set working directory
WORKDIR /build

# Copy source files
COPY CMakeLists.txt .
COPY include include
COPY src src
COPY tests tests

# Build and test
RUN mkdir build && cd build && \
    cmake -DCMAKE_BUILD_TYPE=Release .. && \
    cmake --build . -j$(nproc) && \
    ctest --output-on-failure

# Runtime stage
FROM ubuntu:22.04

# Install runtime dependencies
RUN apt-get update && apt-get install -y \
    libsqlite3-0 \
    libpqxx-6.4 \
    && rm -rf /var/lib/apt/lists/*
COPY libdpp.deb /tmp/libdpp.deb
RUN apt-get update && apt-get install -y /tmp/libdpp.deb && rm -rf /var/lib/apt/lists/* /tmp/libdpp.deb

# Create app directory
WORKDIR /app

# Copy the built executable
COPY --from=builder /build/build/bin/dualstore-bot .

# .env and the local backup database live on the volume
VOLUME ["/app"]

# Run the bot
CMD ["./dualstore-bot"]
